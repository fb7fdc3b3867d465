#include "lexer.hpp"

#include "error.hpp"

#include <cctype>

namespace memocalc {

const char* const kIdentifierPattern = "[A-Za-z_]\\w*";
const char* const kNumeralPattern = "\\d+\\.?\\d*(?:[eE][+-]?\\d+)?i?";
const char* const kOperatorPattern = "[*^+/%-]";
const char* const kGrouperPattern = "[()]";

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isOperator(char c) {
    switch (c) {
    case '+':
    case '-':
    case '*':
    case '/':
    case '%':
    case '^':
        return true;
    default:
        return false;
    }
}

bool isGrouper(char c) {
    return c == '(' || c == ')';
}

bool startsFragment(char c) {
    return c == kCallPlaceholder || isDigit(c) || isIdentifierStart(c) ||
           isOperator(c) || isGrouper(c);
}

// Classifies text in which every outermost call has already been replaced by
// kCallPlaceholder. Anything that starts no fragment is collected into one
// Invalid fragment, so the fragments always cover the whole text.
class Scanner {
  public:
    explicit Scanner(const std::string& source)
        : source_(source) {}

    std::vector<Fragment> scan() {
        std::vector<Fragment> fragments;
        while (!isAtEnd()) {
            fragments.push_back(next());
        }
        return fragments;
    }

  private:
    Fragment next() {
        std::size_t start = current_;
        char c = advance();
        FragmentKind kind = FragmentKind::Invalid;
        if (c == kCallPlaceholder) {
            kind = FragmentKind::Call;
        } else if (isDigit(c)) {
            numeral();
            kind = FragmentKind::Numeral;
        } else if (isIdentifierStart(c)) {
            while (isIdentifierChar(peek())) {
                advance();
            }
            kind = FragmentKind::Variable;
        } else if (isOperator(c)) {
            kind = FragmentKind::Operator;
        } else if (isGrouper(c)) {
            kind = FragmentKind::Grouper;
        } else {
            while (!isAtEnd() && !startsFragment(peek())) {
                advance();
            }
        }
        return Fragment{kind, source_.substr(start, current_ - start)};
    }

    // Rest of "digits[.digits][e[+-]digits][i]" after the first digit. The
    // exponent is only taken when a digit follows it.
    void numeral() {
        skipDigits();
        if (peek() == '.') {
            advance();
            skipDigits();
        }
        if (peek() == 'e' || peek() == 'E') {
            std::size_t digit = current_ + 1;
            if (digit < source_.size() &&
                (source_[digit] == '+' || source_[digit] == '-')) {
                ++digit;
            }
            if (digit < source_.size() && isDigit(source_[digit])) {
                current_ = digit;
                skipDigits();
            }
        }
        if (peek() == 'i') {
            advance();
        }
    }

    void skipDigits() {
        while (isDigit(peek())) {
            advance();
        }
    }

    bool isAtEnd() const {
        return current_ >= source_.size();
    }

    char peek() const {
        if (isAtEnd()) {
            return '\0';
        }
        return source_[current_];
    }

    char advance() {
        return source_[current_++];
    }

    const std::string& source_;
    std::size_t current_ = 0;
};

} // namespace

LexResult lex(const std::string& source) {
    if (source.size() > kMaxInputLength) {
        throw CompileError("input is longer than " +
                           std::to_string(kMaxInputLength) + " characters");
    }
    if (source.find(kCallPlaceholder) != std::string::npos) {
        throw CompileError("\"" + source +
                           "\" is not a valid calculator expression");
    }

    LexResult result;

    // Calls nest ("f[f[x+1,2],g[y]]"): an identifier directly followed by '['
    // opens one, and its end is found by counting brackets.
    std::string substituted;
    std::size_t copied = 0;
    std::size_t current = 0;
    while (current < source.size()) {
        if (!isIdentifierStart(source[current])) {
            ++current;
            continue;
        }
        std::size_t start = current;
        while (current < source.size() && isIdentifierChar(source[current])) {
            ++current;
        }
        if (current == source.size() || source[current] != '[') {
            continue;
        }
        ++current;
        int depth = 1;
        while (current < source.size()) {
            char c = source[current++];
            if (c == '[') {
                ++depth;
            } else if (c == ']') {
                --depth;
            }
            if (depth == 0) {
                break;
            }
        }
        if (depth != 0) {
            throw CompileError("\"" + source +
                               "\" missing closing function bracket ] at "
                               "position " +
                               std::to_string(current));
        }
        result.calls.push_back(source.substr(start, current - start));
        substituted.append(source, copied, start - copied);
        substituted.push_back(kCallPlaceholder);
        copied = current;
    }
    substituted.append(source, copied, std::string::npos);

    result.fragments = Scanner(substituted).scan();
    if (result.fragments.empty()) {
        throw CompileError("\"" + source +
                           "\" is not a valid calculator expression");
    }
    return result;
}

std::vector<std::string> splitArguments(const std::string& inner) {
    std::vector<std::string> args;
    if (inner.empty()) {
        return args;
    }
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            args.push_back(inner.substr(start, i - start));
            start = i + 1;
        }
    }
    args.push_back(inner.substr(start));
    return args;
}

} // namespace memocalc
