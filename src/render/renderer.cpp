#include "ctxstage/renderer.hpp"
#include "ctxstage/platform.hpp"

#include <cctype>
#include <vector>

namespace ctxstage {

namespace {

enum class TokenKind {
    Text,
    Expr,
    If,
    Else,
    Endif,
};

struct Token {
    TokenKind kind = TokenKind::Text;
    std::string value;      // text, or the variable path
    bool negate = false;    // "if not ..."
    size_t line = 1;
};

struct TokenizeResult {
    bool ok = false;
    std::string error;
    std::vector<Token> tokens;
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0])) && s[0] != '_') return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

bool is_variable_path(const std::string& s) {
    size_t start = 0;
    while (true) {
        size_t dot = s.find('.', start);
        std::string part = s.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!is_identifier(part)) return false;
        if (dot == std::string::npos) return true;
        start = dot + 1;
    }
}

size_t count_lines(const std::string& s, size_t from, size_t to) {
    size_t n = 0;
    for (size_t i = from; i < to && i < s.size(); ++i) {
        if (s[i] == '\n') ++n;
    }
    return n;
}

// Drop the indentation before a tag when the tag starts its line
void lstrip_tail(std::string& text, const std::string& src, size_t tag_pos) {
    size_t i = tag_pos;
    while (i > 0 && (src[i - 1] == ' ' || src[i - 1] == '\t')) --i;
    if (i != 0 && src[i - 1] != '\n') return;
    size_t indent = tag_pos - i;
    if (indent <= text.size()) {
        text.erase(text.size() - indent);
    }
}

void rstrip_all(std::string& text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
}

TokenizeResult tokenize(const std::string& src, const std::string& name) {
    TokenizeResult result;

    std::string pending;
    size_t pending_line = 1;
    size_t line = 1;
    size_t pos = 0;

    auto flush_text = [&]() {
        if (!pending.empty()) {
            Token t;
            t.kind = TokenKind::Text;
            t.value = std::move(pending);
            t.line = pending_line;
            result.tokens.push_back(std::move(t));
        }
        pending.clear();
        pending_line = line;
    };

    while (pos < src.size()) {
        size_t open = src.find('{', pos);
        if (open == std::string::npos || open + 1 >= src.size()) {
            pending += src.substr(pos);
            line += count_lines(src, pos, src.size());
            break;
        }

        char marker = src[open + 1];
        if (marker != '{' && marker != '%' && marker != '#') {
            pending += src.substr(pos, open + 1 - pos);
            line += count_lines(src, pos, open + 1);
            pos = open + 1;
            continue;
        }

        pending += src.substr(pos, open - pos);
        line += count_lines(src, pos, open);
        size_t tag_line = line;

        const char* close_marker = marker == '{' ? "}}" : (marker == '%' ? "%}" : "#}");
        size_t close = src.find(close_marker, open + 2);
        if (close == std::string::npos) {
            result.error = name + ":" + std::to_string(tag_line) + ": unterminated tag";
            return result;
        }

        std::string inner = src.substr(open + 2, close - open - 2);
        line += count_lines(src, open, close + 2);
        pos = close + 2;

        bool strip_before = !inner.empty() && inner.front() == '-';
        bool strip_after = !inner.empty() && inner.back() == '-';
        if (strip_before) inner.erase(0, 1);
        if (strip_after && !inner.empty()) inner.pop_back();
        inner = trim(inner);

        if (strip_before) {
            rstrip_all(pending);
        } else if (marker != '{') {
            lstrip_tail(pending, src, open);
        }

        if (marker == '{') {
            if (!is_variable_path(inner)) {
                result.error = name + ":" + std::to_string(tag_line) +
                               ": invalid expression '" + inner + "'";
                return result;
            }
            flush_text();
            Token t;
            t.kind = TokenKind::Expr;
            t.value = inner;
            t.line = tag_line;
            result.tokens.push_back(std::move(t));
        } else if (marker == '%') {
            flush_text();
            Token t;
            t.line = tag_line;
            if (inner == "else") {
                t.kind = TokenKind::Else;
            } else if (inner == "endif") {
                t.kind = TokenKind::Endif;
            } else if (inner.rfind("if ", 0) == 0) {
                std::string cond = trim(inner.substr(3));
                if (cond.rfind("not ", 0) == 0) {
                    t.negate = true;
                    cond = trim(cond.substr(4));
                }
                if (!is_variable_path(cond)) {
                    result.error = name + ":" + std::to_string(tag_line) +
                                   ": invalid condition '" + cond + "'";
                    return result;
                }
                t.kind = TokenKind::If;
                t.value = cond;
            } else {
                result.error = name + ":" + std::to_string(tag_line) +
                               ": unknown tag '" + inner + "'";
                return result;
            }
            result.tokens.push_back(std::move(t));
        }
        // Comments produce nothing

        // Whitespace following the tag
        if (strip_after) {
            while (pos < src.size() && std::isspace(static_cast<unsigned char>(src[pos]))) {
                if (src[pos] == '\n') ++line;
                ++pos;
            }
        } else if (marker != '{') {
            if (pos < src.size() && src[pos] == '\n') {
                ++pos;
                ++line;
            } else if (pos + 1 < src.size() && src[pos] == '\r' && src[pos + 1] == '\n') {
                pos += 2;
                ++line;
            }
        }
        pending_line = line;
    }

    flush_text();
    result.ok = true;
    return result;
}

const nlohmann::json* lookup(const nlohmann::json& context, const std::string& path) {
    const nlohmann::json* current = &context;
    size_t start = 0;
    while (true) {
        size_t dot = path.find('.', start);
        std::string part = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!current->is_object()) return nullptr;
        auto it = current->find(part);
        if (it == current->end()) return nullptr;
        current = &*it;
        if (dot == std::string::npos) return current;
        start = dot + 1;
    }
}

struct IfFrame {
    bool parent_active;
    bool condition;
    bool in_else;
    size_t line;
};

} // namespace

bool is_truthy(const nlohmann::json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<long long>() != 0;
    if (value.is_number_unsigned()) return value.get<unsigned long long>() != 0;
    if (value.is_number_float()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get_ref<const std::string&>().empty();
    return !value.empty();
}

RenderResult render_template(const std::string& source,
                             const nlohmann::json& context,
                             const std::string& template_name) {
    RenderResult result;

    if (!context.is_object()) {
        result.error = template_name + ": context must be an object";
        return result;
    }

    auto tokens = tokenize(source, template_name);
    if (!tokens.ok) {
        result.error = tokens.error;
        return result;
    }

    std::string output;
    output.reserve(source.size());
    std::vector<IfFrame> stack;

    auto active = [&]() {
        if (stack.empty()) return true;
        const auto& top = stack.back();
        return top.parent_active && (top.in_else ? !top.condition : top.condition);
    };

    for (const auto& tok : tokens.tokens) {
        std::string where = template_name + ":" + std::to_string(tok.line);

        switch (tok.kind) {
            case TokenKind::Text:
                if (active()) output += tok.value;
                break;

            case TokenKind::Expr: {
                if (!active()) break;
                const nlohmann::json* value = lookup(context, tok.value);
                if (!value) {
                    result.error = where + ": undefined variable '" + tok.value + "'";
                    return result;
                }
                if (value->is_string()) {
                    output += value->get_ref<const std::string&>();
                } else {
                    output += value->dump();
                }
                break;
            }

            case TokenKind::If: {
                bool parent = active();
                bool condition = false;
                if (parent) {
                    const nlohmann::json* value = lookup(context, tok.value);
                    if (!value) {
                        result.error = where + ": undefined variable '" + tok.value + "'";
                        return result;
                    }
                    condition = is_truthy(*value) != tok.negate;
                }
                stack.push_back(IfFrame{parent, condition, false, tok.line});
                break;
            }

            case TokenKind::Else:
                if (stack.empty() || stack.back().in_else) {
                    result.error = where + ": unexpected else";
                    return result;
                }
                stack.back().in_else = true;
                break;

            case TokenKind::Endif:
                if (stack.empty()) {
                    result.error = where + ": unexpected endif";
                    return result;
                }
                stack.pop_back();
                break;
        }
    }

    if (!stack.empty()) {
        result.error = template_name + ":" + std::to_string(stack.back().line) +
                       ": if without endif";
        return result;
    }

    result.text = std::move(output);
    result.ok = true;
    return result;
}

RenderResult render_template_file(const std::string& path, const nlohmann::json& context) {
    if (!is_regular_file(path)) {
        RenderResult result;
        result.error = "template '" + path + "' is not a file";
        return result;
    }

    auto content = read_file(path);
    if (!content) {
        RenderResult result;
        result.error = "failed to read template: " + path;
        return result;
    }

    return render_template(*content, context, path);
}

} // namespace ctxstage
