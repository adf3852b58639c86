#include "expression.hh"

#include "util/error.hh"

namespace kvchain {

using namespace protocol;

namespace {

struct el_part {
  // an attribute name if placeholder, literal text otherwise
  std::string text;
  bool placeholder = false;
};

std::vector<el_part> parse(std::string_view tmpl) {
  std::vector<el_part> parts;
  size_t pos = 0;
  while (pos < tmpl.size()) {
    auto open = tmpl.find("#{", pos);
    if (open == std::string_view::npos) {
      parts.push_back({.text = std::string(tmpl.substr(pos))});
      break;
    }
    auto close = tmpl.find('}', open + 2);
    if (close == std::string_view::npos) {
      throw util::invalid_argument(tmpl, "unclosed placeholder");
    }
    if (open > pos) {
      parts.push_back({.text = std::string(tmpl.substr(pos, open - pos))});
    }
    auto name = tmpl.substr(open + 2, close - open - 2);
    if (name.empty()) {
      throw util::invalid_argument(tmpl, "empty placeholder");
    }
    parts.push_back({.text = std::string(name), .placeholder = true});
    pos = close + 1;
  }
  return parts;
}

}  // namespace

expression<value> el(std::string_view tmpl) {
  auto parts = parse(tmpl);
  if (parts.empty()) {
    return literal(value{std::string{}});
  }
  if (parts.size() == 1) {
    if (!parts[0].placeholder) {
      return literal(value{std::move(parts[0].text)});
    }
    return [name = std::move(parts[0].text)](const session& s) {
      return s.value(name);
    };
  }
  return [parts = std::move(parts)](const session& s) {
    std::string rendered;
    for (const auto& part : parts) {
      if (!part.placeholder) {
        rendered += part.text;
        continue;
      }
      const auto& v = s.value(part.text);
      if (const auto* str = v.get_if<std::string>(); str != nullptr) {
        rendered += *str;
      } else {
        rendered += fmt::format("{}", v);
      }
    }
    return value{std::move(rendered)};
  };
}

expression<value> literal(value v) {
  return [v = std::move(v)](const session&) { return v; };
}

entry_expr::entry_expr(value_expr key, value_expr val)
  : _f([key = std::move(key), val = std::move(val)](const session& s) {
    return entry{.key = key(s), .val = val(s)};
  }) {}

keys_expr::keys_expr(std::vector<value_expr> keys)
  : _f([keys = std::move(keys)](const session& s) {
    std::vector<value> resolved;
    resolved.reserve(keys.size());
    for (const auto& k : keys) {
      resolved.push_back(k(s));
    }
    return resolved;
  }) {}

entries_expr::entries_expr(std::vector<entry_expr> entries)
  : _f([entries = std::move(entries)](const session& s) {
    entry_map resolved;
    for (const auto& e : entries) {
      auto [k, v] = e(s);
      resolved.insert_or_assign(std::move(k), std::move(v));
    }
    return resolved;
  }) {}

}  // namespace kvchain
