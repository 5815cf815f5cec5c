#include "render/tree_json.h"

#include <cctype>
#include <stdexcept>

#include "ui/color.h"

#ifdef SQLAN_USE_NLOHMANN_JSON
#include <nlohmann/json.hpp>
#endif

namespace sqlan::cli {

#ifdef SQLAN_USE_NLOHMANN_JSON
namespace {

using nlohmann::json;

json statement_to_json(const Statement& statement);

json segment_to_json(const Segment& segment) {
  json obj = json::object();
  obj["name"] = segment.name();
  obj["sql"] = segment.to_sql();
  json items = json::array();
  for (size_t i = 0; i < segment.items().size(); ++i) {
    const auto& item = segment.items()[i];
    json entry = json::object();
    entry["sql"] = segment.item_sql(i);
    entry["alias"] = item.alias.has_value() ? json(*item.alias) : json(nullptr);
    items.push_back(std::move(entry));
  }
  obj["items"] = std::move(items);
  json subqueries = json::array();
  for (const Statement* nested : segment.statements()) {
    subqueries.push_back(statement_to_json(*nested));
  }
  obj["subqueries"] = std::move(subqueries);
  return obj;
}

json statement_to_json(const Statement& statement) {
  json obj = json::object();
  obj["kind"] = statement_kind_name(statement.kind());
  obj["sql"] = statement.to_sql();
  if (const SelectStatement* select = statement.as_select()) {
    obj["distinct"] = select->distinct;
  }
  if (statement.with_clause().has_value()) {
    const WithClause& with = *statement.with_clause();
    json with_obj = json::object();
    with_obj["recursive"] = with.recursive;
    json definitions = json::array();
    for (const auto& definition : with.definitions) {
      json def = json::object();
      def["name"] = definition.name;
      def["columns"] = definition.columns.has_value() ? json(*definition.columns) : json(nullptr);
      def["statement"] = statement_to_json(*definition.statement);
      definitions.push_back(std::move(def));
    }
    with_obj["definitions"] = std::move(definitions);
    obj["with"] = std::move(with_obj);
  } else {
    obj["with"] = nullptr;
  }
  json segments = json::array();
  for (const Segment* segment : statement.segments()) {
    segments.push_back(segment_to_json(*segment));
  }
  obj["segments"] = std::move(segments);
  if (const InsertStatement* insert = statement.as_insert()) {
    obj["source"] = insert->source_query ? statement_to_json(*insert->source_query) : json(nullptr);
  }
  return obj;
}

}  // namespace
#endif

std::string render_query_json(const SqlQuery& query, const FormattingOptions& options) {
#ifdef SQLAN_USE_NLOHMANN_JSON
  json out = json::object();
  out["sql"] = query.to_sql();
  out["formatted"] = query.to_sql(options);
  out["statement_count"] = query.all_statements().size();
  out["root"] = statement_to_json(query.root());
  return out.dump(2);
#else
  (void)query;
  (void)options;
  throw std::runtime_error("JSON output requires nlohmann/json; rebuild with it installed");
#endif
}

std::string colorize_json(const std::string& input, bool enable) {
  if (!enable) return input;
  std::string out;
  out.reserve(input.size() * 2);
  bool in_string = false;
  bool escape = false;
  for (size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
        out += '"';
        out += kColor.reset;
        continue;
      }
      out += c;
      continue;
    }
    if (c == '"') {
      in_string = true;
      out += kColor.green;
      out += '"';
      continue;
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
      out += kColor.cyan;
      while (i < input.size() && std::isdigit(static_cast<unsigned char>(input[i]))) {
        out += input[i++];
      }
      --i;
      out += kColor.reset;
      continue;
    }
    if (input.compare(i, 4, "true") == 0 || input.compare(i, 5, "false") == 0) {
      size_t len = input.compare(i, 4, "true") == 0 ? 4 : 5;
      out += kColor.yellow;
      out.append(input, i, len);
      out += kColor.reset;
      i += len - 1;
      continue;
    }
    if (input.compare(i, 4, "null") == 0) {
      out += kColor.magenta;
      out.append(input, i, 4);
      out += kColor.reset;
      i += 3;
      continue;
    }
    out += c;
  }
  return out;
}

}  // namespace sqlan::cli
