#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "splitdeck/core/SplitLayoutEngine.hpp"

namespace sdeck {

/**
 * @brief AST Node types for .conf files
 */
namespace ast {

using Value = std::variant<int, double, std::string, bool>;

struct Assignment {
    std::string name;
    Value value;
    int line{0};
};

struct Block {
    std::string name;
    std::vector<std::unique_ptr<struct Statement>> statements;
    int line{0};
};

using StatementValue = std::variant<
    Assignment,
    Block
>;

struct Statement {
    StatementValue value;
};

struct ConfigFile {
    std::vector<std::unique_ptr<Block>> blocks;
};

}

enum class TokenType {

    Integer, Float, String, TokTrue, TokFalse,

    Identifier,

    Minus, Colon, Semicolon, Comma,

    LeftBrace, RightBrace,

    EndOfFile, Invalid
};

struct Token {
    TokenType type;
    std::string lexeme;
    int line;
    int column;

    std::variant<std::monostate, int, double, std::string, bool> literal_value;

    Token() : type(TokenType::Invalid), lexeme(""), line(0), column(0), literal_value(std::monostate{}) {}

    Token(TokenType t, std::string lex, int l, int c)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(std::monostate{}) {}

    template <typename T>
    Token(TokenType t, std::string lex, int l, int c, T lit)
        : type(t), lexeme(std::move(lex)), line(l), column(c), literal_value(std::move(lit)) {}
};

class Lexer {
public:
    explicit Lexer(std::string source);

    std::vector<Token> tokenize();
    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    std::string source_;
    size_t current_{0};
    int line_{1};
    int column_{1};
    std::vector<std::string> errors_;

    char peek() const;
    char peekNext() const;
    char advance();
    bool isAtEnd() const;
    void skipWhitespace();
    void skipComment();
    void skipBlockComment();

    Token makeToken(TokenType type);
    Token number();
    Token string();
    Token identifier();

    void addError(const std::string& message);
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    std::unique_ptr<ast::ConfigFile> parse();
    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    std::vector<Token> tokens_;
    size_t current_{0};
    std::vector<std::string> errors_;

    const Token& peek() const;
    const Token& previous() const;
    bool isAtEnd() const;
    const Token& advance();
    bool check(TokenType type) const;
    bool match(std::initializer_list<TokenType> types);
    bool consume(TokenType type, const std::string& message);

    std::unique_ptr<ast::Block> block();
    std::unique_ptr<ast::Statement> statement();
    std::optional<ast::Value> value();

    void addError(const std::string& message);
    void synchronize();
};

class Config {
public:
    struct LayoutConfig {
        double default_ratio{layout_constants::DEFAULT_RATIO};
        double min_ratio{layout_constants::DEFAULT_MIN_RATIO};
        int palette_size{static_cast<int>(layout_constants::DEFAULT_PALETTE_SIZE)};
    };

    struct TabsConfig {
        int max_tabs{0};
    };

    struct LoggingConfig {
        bool verbose{false};
    };

    struct NotificationsConfig {
        bool enabled{true};
        int timeout_ms{1500};
    };

    struct IPCConfig {
        bool enabled{true};
        std::string socket;
    };

    LayoutConfig layout;
    TabsConfig tabs;
    LoggingConfig logging;
    NotificationsConfig notifications;
    IPCConfig ipc;
};

using ConfigErrorCallback = std::function<void(const std::string& message)>;

class ConfigParser {
public:
    explicit ConfigParser(ConfigErrorCallback on_error = nullptr);

    bool load(const std::filesystem::path& path = getDefaultConfigPath());

    bool loadFromString(const std::string& source);

    static std::string getEmbeddedConfig();

    const Config& getConfig() const { return config_; }

    EngineConfig engineConfig() const;

    const std::vector<std::string>& getErrors() const { return errors_; }

    static std::filesystem::path getDefaultConfigPath();

    static std::string getDefaultSocketPath();

    void reportError(const std::string& message);
    void reportErrors(const std::vector<std::string>& errors);

private:
    ConfigErrorCallback on_error_;
    Config config_;
    std::vector<std::string> errors_;

    bool interpret(const ast::ConfigFile& ast);
    void evaluateBlock(const ast::Block& block, const std::string& scope);
    void evaluateAssignment(const ast::Assignment& assign, const std::string& scope);
};

}
