#include "toban/roster/model.hpp"
#include "toban/analysis.hpp"
#include "toban/builder.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <optional>
#include <csignal>
#include <unistd.h>

toban::ScheduleBuilder* g_current_builder = nullptr;

void timeout_handler(int) {
    if (g_current_builder) {
        g_current_builder->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [-s] [-v] [-t SEC] [--start DATE] [--end DATE] <roster-file>\n";
    std::cerr << "  -s            Print build statistics and per-member counts to stderr\n";
    std::cerr << "  -v            Verbose mode (trace every slot decision)\n";
    std::cerr << "  -t SEC        Timeout in seconds (stops between slots)\n";
    std::cerr << "  --start DATE  Override rotation start (YYYY-MM-DD)\n";
    std::cerr << "  --end DATE    Override rotation end (YYYY-MM-DD)\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const toban::ScheduleBuilder& builder, const toban::BuildResult& result) {
    if (!g_print_stats) return;
    const auto& s = builder.stats();
    std::cerr << "% Stats: slots=" << s.slot_count
              << " processed=" << s.processed_count
              << " fixed=" << s.forced_count
              << " fixed_fallbacks=" << s.fallback_count
              << " rule_checks=" << s.rule_check_count
              << " min_pool=" << s.min_pool_size
              << "\n";

    auto report = toban::analyze(builder.problem(), result.assignments);
    for (const auto& [name, c] : report.counts) {
        std::cerr << "% " << name << ": day=" << c.day << " night=" << c.night << "\n";
    }
    for (const auto& v : report.violations) {
        std::cerr << "% violation " << toban::violation_name(v.kind) << " " << v.member
                  << ": " << v.detail << "\n";
    }
}

void print_assignments(const toban::BuildResult& result) {
    for (const auto& a : result.assignments) {
        std::cout << a.slot.date.to_string() << " "
                  << toban::weekday_name(a.slot.date.weekday()) << " "
                  << toban::shift_name(a.slot.shift) << " "
                  << a.slot.index << " "
                  << a.member << "\n";
    }
    for (const auto& note : result.notes) {
        std::cout << "% note: " << note << "\n";
    }
}

int main(int argc, char* argv[]) {
    const char* filename = nullptr;
    int timeout_sec = 0;
    std::optional<std::string> start_override;
    std::optional<std::string> end_override;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--start") == 0 && i + 1 < argc) {
            start_override = argv[++i];
        } else if (std::strcmp(argv[i], "--end") == 0 && i + 1 < argc) {
            end_override = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto roster = toban::roster::parse_file(filename);
        roster->override_period(start_override, end_override);

        toban::ScheduleBuilder builder(roster->to_problem());
        builder.set_verbose(g_verbose);
        g_current_builder = &builder;

        // Setup timeout
        if (timeout_sec > 0) {
            std::signal(SIGALRM, timeout_handler);
            alarm(timeout_sec);
        }

        auto result = builder.build();
        g_current_builder = nullptr;

        print_assignments(result);
        print_stats(builder, result);

        switch (result.status) {
            case toban::BuildStatus::Complete:
                std::cout << "==========\n";
                return 0;
            case toban::BuildStatus::NoCandidate:
                std::cout << "=====NO CANDIDATE=====\n";
                std::cout << result.failure->message();
                return 1;
            case toban::BuildStatus::Stopped:
                std::cout << "=====STOPPED=====\n";
                return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
