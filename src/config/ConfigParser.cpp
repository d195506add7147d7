#include "splitdeck/config/ConfigParser.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace sdeck {

// ============================================================================
// Lexer Implementation
// ============================================================================

Lexer::Lexer(std::string source) : source_(std::move(source)) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    tokens.reserve(source_.size() / 8);

    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) break;

        char c = peek();

        // Skip comments
        if (c == '/' && peekNext() == '/') {
            skipComment();
            continue;
        }

        if (c == '/' && peekNext() == '*') {
            skipBlockComment();
            continue;
        }

        // Numbers
        if (std::isdigit(static_cast<unsigned char>(c))) {
            tokens.push_back(number());
            continue;
        }

        // Strings
        if (c == '"') {
            tokens.push_back(string());
            continue;
        }

        // Identifiers and keywords
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            tokens.push_back(identifier());
            continue;
        }

        switch (c) {
            case '{': tokens.push_back(makeToken(TokenType::LeftBrace)); advance(); break;
            case '}': tokens.push_back(makeToken(TokenType::RightBrace)); advance(); break;
            case ':': tokens.push_back(makeToken(TokenType::Colon)); advance(); break;
            case ';': tokens.push_back(makeToken(TokenType::Semicolon)); advance(); break;
            case ',': tokens.push_back(makeToken(TokenType::Comma)); advance(); break;
            case '-': tokens.push_back(makeToken(TokenType::Minus)); advance(); break;

            default:
                addError(std::string("Unexpected character: ") + c);
                advance();
                break;
        }
    }

    tokens.push_back(Token(TokenType::EndOfFile, "", line_, column_));
    return tokens;
}

char Lexer::peek() const {
    if (isAtEnd()) return '\0';
    return source_[current_];
}

char Lexer::peekNext() const {
    if (current_ + 1 >= source_.length()) return '\0';
    return source_[current_ + 1];
}

char Lexer::advance() {
    char c = source_[current_++];
    column_++;
    if (c == '\n') {
        line_++;
        column_ = 1;
    }
    return c;
}

bool Lexer::isAtEnd() const {
    return current_ >= source_.length();
}

void Lexer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

void Lexer::skipComment() {
    while (!isAtEnd() && peek() != '\n') {
        advance();
    }
}

void Lexer::skipBlockComment() {
    advance(); advance(); // Skip /*
    while (!isAtEnd() && !(peek() == '*' && peekNext() == '/')) {
        advance();
    }
    if (isAtEnd()) {
        addError("Unterminated comment");
        return;
    }
    advance(); advance(); // Skip */
}

Token Lexer::makeToken(TokenType type) {
    return Token(type, std::string(1, peek()), line_, column_);
}

Token Lexer::number() {
    int start_line = line_;
    int start_col = column_;
    std::string num;
    num.reserve(16);

    while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
        num += advance();
    }

    // Check for float
    bool is_float = false;
    if (!isAtEnd() && peek() == '.' && std::isdigit(static_cast<unsigned char>(peekNext()))) {
        is_float = true;
        num += advance(); // consume '.'
        while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
            num += advance();
        }
    }

    try {
        if (is_float) {
            return Token(TokenType::Float, num, start_line, start_col, std::stod(num));
        }
        return Token(TokenType::Integer, num, start_line, start_col, std::stoi(num));
    } catch (const std::out_of_range&) {
        addError("Number out of range: " + num);
        return Token(TokenType::Invalid, num, start_line, start_col);
    }
}

Token Lexer::string() {
    int start_line = line_;
    int start_col = column_;

    advance(); // consume opening "

    std::string str;
    str.reserve(32);
    while (!isAtEnd() && peek() != '"') {
        if (peek() == '\\') {
            advance();
            if (!isAtEnd()) {
                char c = advance();
                switch (c) {
                    case 'n': str += '\n'; break;
                    case 't': str += '\t'; break;
                    case '"': str += '"'; break;
                    case '\\': str += '\\'; break;
                    default: str += c; break;
                }
            }
        } else {
            str += advance();
        }
    }

    if (isAtEnd()) {
        addError("Unterminated string");
        return Token(TokenType::Invalid, str, start_line, start_col);
    }

    advance(); // consume closing "

    return Token(TokenType::String, str, start_line, start_col, str);
}

Token Lexer::identifier() {
    int start_line = line_;
    int start_col = column_;
    std::string text;
    text.reserve(16);

    while (!isAtEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
        text += advance();
    }

    if (text == "true") {
        return Token(TokenType::TokTrue, text, start_line, start_col, true);
    }
    if (text == "false") {
        return Token(TokenType::TokFalse, text, start_line, start_col, false);
    }

    return Token(TokenType::Identifier, text, start_line, start_col);
}

void Lexer::addError(const std::string& message) {
    std::ostringstream oss;
    oss << "Line " << line_ << ", Col " << column_ << ": " << message;
    errors_.push_back(oss.str());
}

// ============================================================================
// Parser Implementation
// ============================================================================

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::EndOfFile) {
        tokens_.push_back(Token(TokenType::EndOfFile, "", 0, 0));
    }
}

std::unique_ptr<ast::ConfigFile> Parser::parse() {
    auto config = std::make_unique<ast::ConfigFile>();

    while (!isAtEnd()) {
        if (!check(TokenType::Identifier)) {
            addError("Expected block name, got '" + peek().lexeme + "'");
            advance();
            continue;
        }

        auto blk = block();
        if (blk) {
            config->blocks.push_back(std::move(blk));
        }
    }

    return config;
}

const Token& Parser::peek() const {
    return tokens_[current_];
}

const Token& Parser::previous() const {
    return tokens_[current_ == 0 ? 0 : current_ - 1];
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::EndOfFile;
}

const Token& Parser::advance() {
    if (!isAtEnd()) current_++;
    return previous();
}

bool Parser::check(TokenType type) const {
    if (isAtEnd()) return false;
    return peek().type == type;
}

bool Parser::match(std::initializer_list<TokenType> types) {
    for (auto type : types) {
        if (check(type)) {
            advance();
            return true;
        }
    }
    return false;
}

bool Parser::consume(TokenType type, const std::string& message) {
    if (check(type)) {
        advance();
        return true;
    }
    addError(message);
    return false;
}

std::unique_ptr<ast::Block> Parser::block() {
    auto blk = std::make_unique<ast::Block>();
    blk->line = peek().line;
    blk->name = advance().lexeme;

    if (!consume(TokenType::Colon, "Expected ':' after block name") ||
        !consume(TokenType::LeftBrace, "Expected '{' to start block")) {
        synchronize();
        return nullptr;
    }

    while (!check(TokenType::RightBrace) && !isAtEnd()) {
        auto stmt = statement();
        if (stmt) {
            blk->statements.push_back(std::move(stmt));
        }
    }

    consume(TokenType::RightBrace, "Expected '}' to close block '" + blk->name + "'");

    // Optional semicolon after block
    match({TokenType::Semicolon});

    return blk;
}

std::unique_ptr<ast::Statement> Parser::statement() {
    if (!check(TokenType::Identifier)) {
        addError("Expected key, got '" + peek().lexeme + "'");
        synchronize();
        return nullptr;
    }

    // Nested block: name: { ... }
    if (tokens_[current_ + 1].type == TokenType::Colon &&
        current_ + 2 < tokens_.size() && tokens_[current_ + 2].type == TokenType::LeftBrace) {
        auto blk = block();
        if (!blk) return nullptr;
        auto stmt = std::make_unique<ast::Statement>();
        stmt->value = std::move(*blk);
        return stmt;
    }

    ast::Assignment assign;
    assign.line = peek().line;
    assign.name = advance().lexeme;

    if (!consume(TokenType::Colon, "Expected ':' after '" + assign.name + "'")) {
        synchronize();
        return nullptr;
    }

    auto v = value();
    if (!v) {
        synchronize();
        return nullptr;
    }
    assign.value = std::move(*v);

    // Optional separator
    match({TokenType::Semicolon, TokenType::Comma});

    auto stmt = std::make_unique<ast::Statement>();
    stmt->value = std::move(assign);
    return stmt;
}

std::optional<ast::Value> Parser::value() {
    bool negative = match({TokenType::Minus});

    if (match({TokenType::Integer})) {
        int v = std::get<int>(previous().literal_value);
        return ast::Value{negative ? -v : v};
    }
    if (match({TokenType::Float})) {
        double v = std::get<double>(previous().literal_value);
        return ast::Value{negative ? -v : v};
    }
    if (negative) {
        addError("Expected number after '-'");
        return std::nullopt;
    }

    if (match({TokenType::String})) {
        return ast::Value{std::get<std::string>(previous().literal_value)};
    }
    if (match({TokenType::TokTrue, TokenType::TokFalse})) {
        return ast::Value{std::get<bool>(previous().literal_value)};
    }
    // Bare words are strings: protocol: ssh
    if (match({TokenType::Identifier})) {
        return ast::Value{previous().lexeme};
    }

    addError("Expected value, got '" + peek().lexeme + "'");
    return std::nullopt;
}

void Parser::addError(const std::string& message) {
    std::ostringstream oss;
    oss << "Line " << peek().line << ": " << message;
    errors_.push_back(oss.str());
}

void Parser::synchronize() {
    while (!isAtEnd()) {
        if (check(TokenType::RightBrace)) return;
        if (match({TokenType::Semicolon})) return;
        advance();
    }
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

namespace {

    std::optional<double> asNumber(const ast::Value& v) {
        if (auto* i = std::get_if<int>(&v)) return static_cast<double>(*i);
        if (auto* d = std::get_if<double>(&v)) return *d;
        return std::nullopt;
    }

    std::string expandHome(const std::string& path) {
        if (path.empty() || path[0] != '~') return path;
        const char* home = std::getenv("HOME");
        return home ? std::string(home) + path.substr(1) : path;
    }
}

ConfigParser::ConfigParser(ConfigErrorCallback on_error)
    : on_error_(std::move(on_error))
{
    config_.ipc.socket = getDefaultSocketPath();
}

bool ConfigParser::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        reportError("Config file not found: " + path.string());
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        reportError("Failed to open config file: " + path.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

bool ConfigParser::loadFromString(const std::string& source) {
    // Tokenize
    Lexer lexer(source);
    auto tokens = lexer.tokenize();

    if (!lexer.getErrors().empty()) {
        reportErrors(lexer.getErrors());
        return false;
    }

    // Parse
    Parser parser(std::move(tokens));
    auto ast = parser.parse();

    if (!parser.getErrors().empty()) {
        reportErrors(parser.getErrors());
        return false;
    }

    // Interpret
    return interpret(*ast);
}

std::string ConfigParser::getEmbeddedConfig() {
    // Used when no config file is found
    return R"(
splitdeck: {
    layout: {
        default_ratio: 0.5
        min_ratio: 0.1
        palette_size: 6
    }

    tabs: {
        max_tabs: 0     // unlimited
    }

    logging: {
        verbose: false
    }

    notifications: {
        enabled: true
        timeout_ms: 1500
    }

    ipc: {
        enabled: true
    }
}
)";
}

bool ConfigParser::interpret(const ast::ConfigFile& ast) {
    for (const auto& blk : ast.blocks) {
        if (blk) {
            evaluateBlock(*blk, "");
        }
    }
    return true;
}

void ConfigParser::evaluateBlock(const ast::Block& block, const std::string& scope) {
    // The outer splitdeck block only groups the sections
    if (block.name == "splitdeck" && scope.empty()) {
        for (const auto& stmt : block.statements) {
            if (auto* nested = std::get_if<ast::Block>(&stmt->value)) {
                evaluateBlock(*nested, "");
            } else {
                const auto& assign = std::get<ast::Assignment>(stmt->value);
                reportError("Line " + std::to_string(assign.line) + ": '" + assign.name +
                            "' must be inside a section");
            }
        }
        return;
    }

    if (!scope.empty() || (block.name != "layout" && block.name != "tabs" &&
                           block.name != "logging" && block.name != "notifications" &&
                           block.name != "ipc")) {
        std::string full = scope.empty() ? block.name : scope + "." + block.name;
        reportError("Line " + std::to_string(block.line) + ": Unknown section '" + full + "'");
        return;
    }

    for (const auto& stmt : block.statements) {
        std::visit([this, &block](auto&& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ast::Assignment>) {
                evaluateAssignment(value, block.name);
            } else {
                evaluateBlock(value, block.name);
            }
        }, stmt->value);
    }
}

void ConfigParser::evaluateAssignment(const ast::Assignment& assign, const std::string& scope) {
    const std::string key = scope + "." + assign.name;
    const std::string where = "Line " + std::to_string(assign.line) + ": ";
    const ast::Value& v = assign.value;

    auto expectNumber = [&](double lo, double hi, bool inclusive) -> std::optional<double> {
        auto n = asNumber(v);
        if (!n) {
            reportError(where + key + " expects a number");
            return std::nullopt;
        }
        bool ok = inclusive ? (*n >= lo && *n <= hi) : (*n > lo && *n < hi);
        if (!ok) {
            std::ostringstream oss;
            oss << where << key << " = " << *n << " is out of range, keeping default";
            reportError(oss.str());
            return std::nullopt;
        }
        return n;
    };

    auto expectInt = [&](int lo, int hi) -> std::optional<int> {
        auto* i = std::get_if<int>(&v);
        if (!i) {
            reportError(where + key + " expects an integer");
            return std::nullopt;
        }
        if (*i < lo || *i > hi) {
            reportError(where + key + " = " + std::to_string(*i) + " is out of range, keeping default");
            return std::nullopt;
        }
        return *i;
    };

    auto expectBool = [&]() -> std::optional<bool> {
        auto* b = std::get_if<bool>(&v);
        if (!b) {
            reportError(where + key + " expects true or false");
            return std::nullopt;
        }
        return *b;
    };

    if (key == "layout.default_ratio") {
        if (auto n = expectNumber(0.0, 1.0, false)) config_.layout.default_ratio = *n;
    } else if (key == "layout.min_ratio") {
        if (auto n = expectNumber(0.0, 0.5, false)) config_.layout.min_ratio = *n;
    } else if (key == "layout.palette_size") {
        if (auto i = expectInt(1, static_cast<int>(SPLIT_PALETTE.size()))) config_.layout.palette_size = *i;
    } else if (key == "tabs.max_tabs") {
        if (auto i = expectInt(0, 1 << 20)) config_.tabs.max_tabs = *i;
    } else if (key == "logging.verbose") {
        if (auto b = expectBool()) config_.logging.verbose = *b;
    } else if (key == "notifications.enabled") {
        if (auto b = expectBool()) config_.notifications.enabled = *b;
    } else if (key == "notifications.timeout_ms") {
        if (auto i = expectInt(1, 600000)) config_.notifications.timeout_ms = *i;
    } else if (key == "ipc.enabled") {
        if (auto b = expectBool()) config_.ipc.enabled = *b;
    } else if (key == "ipc.socket") {
        auto* s = std::get_if<std::string>(&v);
        if (!s || s->empty()) {
            reportError(where + key + " expects a path");
        } else {
            config_.ipc.socket = expandHome(*s);
        }
    } else {
        reportError(where + "Unknown key '" + key + "'");
    }
}

EngineConfig ConfigParser::engineConfig() const {
    EngineConfig engine;
    engine.default_ratio = config_.layout.default_ratio;
    engine.min_ratio = config_.layout.min_ratio;
    engine.palette_size = static_cast<std::size_t>(config_.layout.palette_size);
    engine.max_tabs = static_cast<std::size_t>(config_.tabs.max_tabs);
    engine.verbose = config_.logging.verbose;
    return engine;
}

void ConfigParser::reportError(const std::string& message) {
    errors_.push_back(message);
    std::cerr << "Config: " << message << std::endl;
    if (on_error_) {
        on_error_(message);
    }
}

void ConfigParser::reportErrors(const std::vector<std::string>& errors) {
    for (const auto& error : errors) {
        reportError(error);
    }
}

std::filesystem::path ConfigParser::getDefaultConfigPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::filesystem::path(xdg) / "splitdeck" / "splitdeck.conf";
    }

    const char* home = std::getenv("HOME");
    if (!home) return "/etc/splitdeck/splitdeck.conf";

    return std::filesystem::path(home) / ".config" / "splitdeck" / "splitdeck.conf";
}

std::string ConfigParser::getDefaultSocketPath() {
    const char* home = std::getenv("HOME");
    std::string config_dir = home ? std::string(home) + "/.config/splitdeck" : "/tmp/splitdeck";
    return config_dir + "/splitdeck.sock";
}

}
