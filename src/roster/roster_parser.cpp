#include "toban/roster/model.hpp"
#include "parser.hpp"
#include <stdexcept>
#include <cstdio>

// flex が生成するスキャナ API（lexer.cpp）
int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

namespace toban {
namespace roster {

namespace {

/**
 * @brief 初期化済みスキャナでパースを実行し、モデルを取り出す
 */
std::unique_ptr<Model> run_parser(yyscan_t scanner) {
    ParserContext ctx;
    ctx.model = std::make_unique<Model>();
    int result = yyparse(scanner, &ctx);
    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }
    return std::move(ctx.model);
}

} // namespace

std::unique_ptr<Model> parse_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    yyscan_t scanner;
    yylex_init(&scanner);
    yyset_in(file, scanner);

    std::unique_ptr<Model> model;
    try {
        model = run_parser(scanner);
    } catch (const std::exception&) {
        yylex_destroy(scanner);
        fclose(file);
        throw;
    }

    yylex_destroy(scanner);
    fclose(file);
    return model;
}

std::unique_ptr<Model> parse_string(const std::string& input) {
    yyscan_t scanner;
    yylex_init(&scanner);
    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    std::unique_ptr<Model> model;
    try {
        model = run_parser(scanner);
    } catch (const std::exception&) {
        yy_delete_buffer(buffer, scanner);
        yylex_destroy(scanner);
        throw;
    }

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);
    return model;
}

} // namespace roster
} // namespace toban
