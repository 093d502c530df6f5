#include "mcphub/utils/uri_template.hpp"
#include "mcphub/utils/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <regex>

namespace mcphub {
namespace uri_template {

namespace {

struct Operator {
  char symbol;       ///< '\0' for simple expansion
  const char *first; ///< Emitted before the first defined value
  const char *sep;   ///< Between values
  bool named;        ///< name=value pairs
  const char *ifemp; ///< Suffix of a named empty value
  bool reserved;     ///< Reserved characters pass through
};

struct VarSpec {
  std::string name;
  std::size_t prefix = 0; ///< 0 means the whole value
  bool explode = false;
};

struct Expression {
  Operator op;
  std::vector<VarSpec> vars;
};

// RFC 6570 section 3.2, appendix A
const Operator kOperators[] = {
    {'\0', "", ",", false, "", false}, {'+', "", ",", false, "", true},
    {'#', "#", ",", false, "", true},  {'.', ".", ".", false, "", false},
    {'/', "/", "/", false, "", false}, {';', ";", ";", true, "", false},
    {'?', "?", "&", true, "=", false}, {'&', "&", "&", true, "=", false},
};

bool isUnreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

bool isReserved(unsigned char c) {
  static const std::string reserved = ":/?#[]@!$&'()*+,;=";
  return reserved.find(static_cast<char>(c)) != std::string::npos;
}

std::string encode(const std::string &value, bool allow_reserved) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const auto c = static_cast<unsigned char>(value[i]);
    if (isUnreserved(c) || (allow_reserved && isReserved(c))) {
      out += static_cast<char>(c);
    } else if (allow_reserved && c == '%' && i + 2 < value.size() &&
               std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
      // Already percent-encoded triplet
      out += value.substr(i, 3);
      i += 2;
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

std::string decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size() &&
        std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
      out += static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16));
      i += 2;
    } else {
      out += value[i];
    }
  }
  return out;
}

// Truncate to a number of UTF-8 code points.
std::string prefixOf(const std::string &value, std::size_t length) {
  std::size_t points = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    if ((static_cast<unsigned char>(value[i]) & 0xC0) != 0x80) {
      if (points == length) {
        return value.substr(0, i);
      }
      ++points;
    }
  }
  return value;
}

Expression parseExpression(const std::string &body) {
  Expression expr{kOperators[0], {}};
  std::string vars = body;
  if (!body.empty()) {
    for (const auto &op : kOperators) {
      if (op.symbol != '\0' && body[0] == op.symbol) {
        expr.op = op;
        vars = body.substr(1);
        break;
      }
    }
  }

  std::size_t start = 0;
  while (start <= vars.size()) {
    auto end = vars.find(',', start);
    if (end == std::string::npos) {
      end = vars.size();
    }
    std::string spec = vars.substr(start, end - start);
    start = end + 1;
    if (spec.empty()) {
      continue;
    }

    VarSpec var;
    if (spec.back() == '*') {
      var.explode = true;
      spec.pop_back();
    }
    auto colon = spec.find(':');
    if (colon != std::string::npos) {
      try {
        var.prefix = static_cast<std::size_t>(std::stoul(spec.substr(colon + 1)));
      } catch (const std::exception &) {
        throw ProtocolException(types::ErrorCode::InvalidParams,
                                "Invalid prefix modifier in {" + body + "}");
      }
      spec = spec.substr(0, colon);
    }
    var.name = spec;
    expr.vars.push_back(std::move(var));
  }
  return expr;
}

/// Calls on_literal / on_expression for each part of the template.
template <typename Literal, typename Expr>
void walk(const std::string &uri_template, Literal on_literal,
          Expr on_expression) {
  std::size_t pos = 0;
  while (pos < uri_template.size()) {
    auto open = uri_template.find('{', pos);
    if (open == std::string::npos) {
      on_literal(uri_template.substr(pos));
      return;
    }
    if (open > pos) {
      on_literal(uri_template.substr(pos, open - pos));
    }
    auto close = uri_template.find('}', open);
    if (close == std::string::npos) {
      throw ProtocolException(types::ErrorCode::InvalidParams,
                              "Unterminated expression in URI template: " +
                                  uri_template);
    }
    on_expression(
        parseExpression(uri_template.substr(open + 1, close - open - 1)));
    pos = close + 1;
  }
}

std::string scalar(const nlohmann::json &value) {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

bool isDefined(const nlohmann::json &value) {
  if (value.is_null()) {
    return false;
  }
  if (value.is_array() || value.is_object()) {
    return !value.empty();
  }
  return true;
}

std::string expandExpression(const Expression &expr,
                             const nlohmann::json &variables) {
  const Operator &op = expr.op;
  std::string out;
  bool first = true;

  for (const auto &var : expr.vars) {
    if (!variables.is_object() || !variables.contains(var.name) ||
        !isDefined(variables[var.name])) {
      continue;
    }
    const auto &value = variables[var.name];
    out += first ? op.first : op.sep;
    first = false;

    if (!value.is_array() && !value.is_object()) {
      std::string text = scalar(value);
      if (var.prefix > 0) {
        text = prefixOf(text, var.prefix);
      }
      if (op.named) {
        out += encode(var.name, false);
        out += text.empty() ? std::string(op.ifemp) : "=";
      }
      out += encode(text, op.reserved);
      continue;
    }

    // Composite values: lists and associative arrays
    std::vector<std::pair<std::string, std::string>> items;
    if (value.is_array()) {
      for (const auto &item : value) {
        items.emplace_back(std::string(), scalar(item));
      }
    } else {
      for (const auto &[key, item] : value.items()) {
        items.emplace_back(key, scalar(item));
      }
    }

    if (!var.explode) {
      if (op.named) {
        out += encode(var.name, false) + "=";
      }
      bool first_item = true;
      for (const auto &[key, item] : items) {
        if (!first_item) {
          out += ",";
        }
        first_item = false;
        if (value.is_object()) {
          out += encode(key, op.reserved) + ",";
        }
        out += encode(item, op.reserved);
      }
      continue;
    }

    bool first_item = true;
    for (const auto &[key, item] : items) {
      if (!first_item) {
        out += op.sep;
      }
      first_item = false;
      if (value.is_object()) {
        out += encode(key, op.reserved);
        out += item.empty() && op.named ? std::string(op.ifemp) : "=";
      } else if (op.named) {
        out += encode(var.name, false);
        out += item.empty() ? std::string(op.ifemp) : "=";
      }
      out += encode(item, op.reserved);
    }
  }
  return out;
}

std::string escapeRegex(const std::string &text) {
  static const std::string special = "\\^$.|?*+()[]{}";
  std::string out;
  for (char c : text) {
    if (special.find(c) != std::string::npos) {
      out += '\\';
    }
    out += c;
  }
  return out;
}

} // namespace

bool isTemplate(const std::string &uri) {
  static const std::regex expression(R"(\{[^}\s]+\})");
  return std::regex_search(uri, expression);
}

std::vector<std::string> variableNames(const std::string &uri_template) {
  std::vector<std::string> names;
  walk(
      uri_template, [](const std::string &) {},
      [&names](const Expression &expr) {
        for (const auto &var : expr.vars) {
          if (std::find(names.begin(), names.end(), var.name) == names.end()) {
            names.push_back(var.name);
          }
        }
      });
  return names;
}

std::string expand(const std::string &uri_template,
                   const nlohmann::json &variables) {
  std::string out;
  walk(
      uri_template, [&out](const std::string &literal) { out += literal; },
      [&out, &variables](const Expression &expr) {
        out += expandExpression(expr, variables);
      });
  return out;
}

std::optional<nlohmann::json> match(const std::string &uri_template,
                                    const std::string &uri) {
  struct Capture {
    std::string name;
    bool explode;
    char split;
  };

  std::string pattern = "^";
  std::vector<Capture> captures;

  walk(
      uri_template,
      [&pattern](const std::string &literal) { pattern += escapeRegex(literal); },
      [&pattern, &captures](const Expression &expr) {
        const char symbol = expr.op.symbol;
        for (std::size_t i = 0; i < expr.vars.size(); ++i) {
          const auto &var = expr.vars[i];
          const std::string name = escapeRegex(var.name);
          char split = ',';
          switch (symbol) {
          case '+':
          case '#':
            if (i == 0 && symbol == '#') {
              pattern += "#";
            } else if (i > 0) {
              pattern += ",";
            }
            pattern += "(.+)";
            break;
          case '.':
            pattern += "\\.([^/,.?#]+)";
            split = '.';
            break;
          case '/':
            pattern += var.explode ? "/([^?#]+)" : "/([^/,?#]+)";
            split = '/';
            break;
          case ';':
            pattern += ";" + name + "(?:=([^;/?#]*))?";
            break;
          case '?':
          case '&':
            // Query parameters are optional in the URI
            pattern += std::string("(?:") +
                       (i == 0 && symbol == '?' ? "\\?" : "&") + name +
                       "=([^&#]*))?";
            break;
          default:
            if (i > 0) {
              pattern += ",";
            }
            pattern += var.explode ? "([^/?#&]+)" : "([^/,?#&]+)";
            break;
          }
          captures.push_back({var.name, var.explode, split});
        }
      });
  pattern += "$";

  std::smatch groups;
  if (!std::regex_match(uri, groups, std::regex(pattern))) {
    return std::nullopt;
  }

  nlohmann::json result = nlohmann::json::object();
  for (std::size_t i = 0; i < captures.size(); ++i) {
    const auto &group = groups[i + 1];
    if (!group.matched) {
      continue;
    }
    const auto &capture = captures[i];
    const std::string raw = group.str();
    if (!capture.explode) {
      result[capture.name] = decode(raw);
      continue;
    }
    nlohmann::json items = nlohmann::json::array();
    std::size_t start = 0;
    while (start <= raw.size()) {
      auto end = raw.find(capture.split, start);
      if (end == std::string::npos) {
        end = raw.size();
      }
      items.push_back(decode(raw.substr(start, end - start)));
      start = end + 1;
    }
    result[capture.name] = std::move(items);
  }
  return result;
}

} // namespace uri_template
} // namespace mcphub
