// FASTBuild LSP server (stdio JSON-RPC)
//
// A thin wrapper around bff::lsp::Workspace. Only protocol messages are
// written to stdout; log lines go to stderr.
//
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <bff/basic/uri.hpp>
#include <bff/lsp/workspace.hpp>
#include <bff/project/project_config.hpp>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

using nlohmann::json;

namespace
{

constexpr const char * k_server_name = "bff_lsp_server";

template <typename... Args>
void log_line(fmt::format_string<Args...> format, Args &&... args)
{
  fmt::print(
    std::cerr, "[{}] {}\n", k_server_name, fmt::format(format, std::forward<Args>(args)...));
}

struct DocState
{
  std::string uri;
  std::string text;
  std::vector<uint32_t> line_offsets;  // byte offsets of each line start
};

std::vector<uint32_t> build_line_offsets(std::string_view text)
{
  std::vector<uint32_t> offsets;
  offsets.push_back(0);
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      offsets.push_back(static_cast<uint32_t>(i + 1));
    }
  }
  return offsets;
}

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

std::string_view line_text(const DocState & doc, uint32_t line)
{
  if (line >= doc.line_offsets.size()) {
    return {};
  }
  const uint32_t start = doc.line_offsets[line];
  const uint32_t end = (line + 1 < doc.line_offsets.size())
                         ? doc.line_offsets[line + 1]
                         : static_cast<uint32_t>(doc.text.size());
  return std::string_view(doc.text).substr(start, end - start);
}

/// UTF-16 code units of the UTF-8 lead byte `c` (0 for continuation bytes).
uint32_t utf16_units_of(unsigned char c)
{
  if ((c & 0xC0) == 0x80) return 0;
  return c >= 0xF0 ? 2 : 1;
}

uint32_t utf16_to_byte_column(const DocState & doc, uint32_t line, uint32_t character)
{
  const std::string_view slice = line_text(doc, line);
  uint32_t units = 0;
  uint32_t byte = 0;
  while (byte < slice.size() && units < character) {
    units += utf16_units_of(static_cast<unsigned char>(slice[byte]));
    ++byte;
    while (byte < slice.size() && utf16_units_of(static_cast<unsigned char>(slice[byte])) == 0) {
      ++byte;
    }
  }
  return byte;
}

uint32_t byte_to_utf16_column(const DocState & doc, uint32_t line, uint32_t byte_col)
{
  const std::string_view slice = line_text(doc, line);
  uint32_t units = 0;
  for (uint32_t i = 0; i < byte_col && i < slice.size(); ++i) {
    units += utf16_units_of(static_cast<unsigned char>(slice[i]));
  }
  return units;
}

int lsp_severity(std::string_view s)
{
  // LSP DiagnosticSeverity:
  // 1 Error, 2 Warning, 3 Information, 4 Hint
  if (s == "error") return 1;
  if (s == "warning") return 2;
  if (s == "info") return 3;
  if (s == "hint") return 4;
  return 3;
}

int completion_kind(std::string_view s)
{
  // LSP CompletionItemKind (subset)
  if (s == "Variable") return 6;
  if (s == "Property") return 10;
  return 1;  // Text
}

int symbol_kind(std::string_view s)
{
  // LSP SymbolKind (subset)
  if (s == "Function") return 12;
  return 13;  // Variable
}

json empty_range()
{
  return json{
    {"start", json{{"line", 0}, {"character", 0}}},
    {"end", json{{"line", 0}, {"character", 0}}}};
}

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

std::optional<json> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    if (starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  try {
    return json::parse(body);
  } catch (const json::parse_error & e) {
    log_line("ignoring malformed message: {}", e.what());
    return std::nullopt;
  }
}

/// Directory of the workspace from `initialize` params, if it is a local folder.
std::optional<std::filesystem::path> workspace_folder(const json & params)
{
  if (params.contains("rootUri") && params["rootUri"].is_string()) {
    if (auto p = bff::file_uri_to_path(params["rootUri"].get<std::string>())) {
      return std::filesystem::path(*p);
    }
  }
  if (params.contains("rootPath") && params["rootPath"].is_string()) {
    return std::filesystem::path(params["rootPath"].get<std::string>());
  }
  return std::nullopt;
}

/// `fastbuild.rootFile` from didChangeConfiguration settings or initializationOptions.
std::optional<std::string> root_file_setting(const json & settings)
{
  if (!settings.is_object()) {
    return std::nullopt;
  }
  const json * scope = &settings;
  if (settings.contains("fastbuild") && settings["fastbuild"].is_object()) {
    scope = &settings["fastbuild"];
  }
  if (scope->contains("rootFile") && (*scope)["rootFile"].is_string()) {
    return (*scope)["rootFile"].get<std::string>();
  }
  return std::nullopt;
}

}  // namespace

int main()
{
  try {
    bff::lsp::Workspace ws;

    std::unordered_map<std::string, DocState> docs;
    std::string negotiated_position_encoding = "utf-16";
    bool related_information_supported = false;

    // Root file from bff.yaml; the editor setting overrides it when non-empty.
    std::string project_root_file;

    // Files that currently show diagnostics.
    std::set<std::string> published;

    auto is_utf16 = [&]() { return negotiated_position_encoding == "utf-16"; };

    auto upsert_doc = [&](const std::string & uri, const std::string & text) {
      auto & d = docs[uri];
      d.uri = uri;
      d.text = text;
      d.line_offsets = build_line_offsets(d.text);
      ws.set_document(uri, text);
    };

    auto to_workspace_position = [&](const std::string & uri, const json & pos) {
      const auto line = pos.value<uint32_t>("line", 0U);
      auto character = pos.value<uint32_t>("character", 0U);
      auto it = docs.find(uri);
      if (is_utf16() && it != docs.end()) {
        character = utf16_to_byte_column(it->second, line, character);
      }
      return std::make_pair(line, character);
    };

    auto to_lsp_position = [&](const std::string & uri, const json & pos) -> json {
      const auto line = pos.value<uint32_t>("line", 0U);
      auto character = pos.value<uint32_t>("character", 0U);
      auto it = docs.find(uri);
      if (is_utf16() && it != docs.end()) {
        character = byte_to_utf16_column(it->second, line, character);
      }
      return json{{"line", line}, {"character", character}};
    };

    auto to_lsp_range = [&](const std::string & uri, const json & range) -> json {
      if (!range.is_object()) {
        return empty_range();
      }
      return json{
        {"start", to_lsp_position(uri, range.value("start", json::object()))},
        {"end", to_lsp_position(uri, range.value("end", json::object()))},
      };
    };

    auto to_lsp_location = [&](const json & loc) -> json {
      const std::string uri = loc.value("uri", "");
      return json{{"uri", uri}, {"range", to_lsp_range(uri, loc.value("range", json()))}};
    };

    auto publish = [&](const std::string & uri, json diagnostics) {
      json notif;
      notif["jsonrpc"] = "2.0";
      notif["method"] = "textDocument/publishDiagnostics";
      notif["params"] = json{{"uri", uri}, {"diagnostics", std::move(diagnostics)}};
      write_message(notif);
    };

    // Re-evaluates the root of every open document, publishes each file's
    // diagnostics and clears files that no longer have any.
    auto publish_all_diagnostics = [&]() {
      std::map<std::string, std::string> doc_for_root;
      for (const auto & [uri, doc] : docs) {
        std::string root = ws.root_uri(uri);
        if (root.empty()) {
          root = uri;  // invalid root setting: reported on the document itself
        }
        doc_for_root.emplace(root, uri);
      }

      std::map<std::string, json> by_file;
      for (const auto & [root, uri] : doc_for_root) {
        const json dj = json::parse(ws.diagnostics_json(uri));
        for (const auto & file : dj["files"]) {
          const std::string file_uri = file.value("uri", "");
          auto & out = by_file[file_uri];
          if (out.is_null()) {
            out = json::array();
          }
          for (const auto & it : file["items"]) {
            json d0;
            d0["message"] = it.value("message", "");
            d0["severity"] = lsp_severity(it.value("severity", "info"));
            d0["source"] = it.value("source", "");
            d0["range"] = to_lsp_range(file_uri, it.value("range", json()));
            if (related_information_supported && it.contains("relatedInformation")) {
              json related = json::array();
              for (const auto & info : it["relatedInformation"]) {
                related.push_back(json{
                  {"location", to_lsp_location(info["location"])},
                  {"message", info.value("message", "")}});
              }
              d0["relatedInformation"] = std::move(related);
            }
            out.push_back(std::move(d0));
          }
        }
      }

      for (const auto & uri : published) {
        if (by_file.count(uri) == 0) {
          publish(uri, json::array());
        }
      }
      published.clear();
      for (auto & [uri, diagnostics] : by_file) {
        published.insert(uri);
        publish(uri, std::move(diagnostics));
      }
    };

    auto apply_root_setting = [&](const std::optional<std::string> & setting) {
      if (setting && !setting->empty()) {
        ws.set_root_file(*setting);
      } else {
        ws.set_root_file(project_root_file);
      }
    };

    auto load_project = [&](const std::filesystem::path & folder) {
      const auto config_path = bff::find_project_config(folder);
      if (!config_path) {
        return;
      }
      const auto loaded = bff::load_project_config(*config_path);
      if (!loaded.success) {
        log_line("{}: {}", config_path->string(), loaded.error);
        return;
      }
      log_line("using project configuration {}", config_path->string());
      ws.set_evaluation_options(bff::make_evaluation_options(loaded.config));
      if (loaded.config.root_file) {
        project_root_file = loaded.config.root_file->string();
      }
    };

    bool running = true;
    while (running) {
      const auto msg_opt = read_message();
      if (!msg_opt) {
        if (!std::cin.good()) {
          break;
        }
        continue;
      }

      const json & msg = *msg_opt;
      const std::string method = msg.value("method", "");
      const bool is_request = msg.contains("id");

      auto respond = [&](const json & id, const json & result) {
        json resp;
        resp["jsonrpc"] = "2.0";
        resp["id"] = id;
        resp["result"] = result;
        write_message(resp);
      };

      auto respond_error = [&](const json & id, int code, std::string message) {
        json resp;
        resp["jsonrpc"] = "2.0";
        resp["id"] = id;
        resp["error"] = json{{"code", code}, {"message", std::move(message)}};
        write_message(resp);
      };

      const json params = msg.value("params", json::object());
      const auto td = params.value("textDocument", json::object());
      const std::string uri = td.value("uri", "");

      if (method == "initialize" && is_request) {
        const auto caps_in = params.value("capabilities", json::object());

        // Prefer byte columns when the client offers them.
        const auto general = caps_in.value("general", json::object());
        for (const auto & e : general.value("positionEncodings", json::array())) {
          if (e.is_string() && e.get<std::string>() == "utf-8") {
            negotiated_position_encoding = "utf-8";
          }
        }

        const auto text_document = caps_in.value("textDocument", json::object());
        const auto publish_caps = text_document.value("publishDiagnostics", json::object());
        related_information_supported = publish_caps.value("relatedInformation", false);

        if (const auto folder = workspace_folder(params)) {
          load_project(*folder);
        }
        apply_root_setting(root_file_setting(params.value("initializationOptions", json())));

        json caps;
        caps["positionEncoding"] = negotiated_position_encoding;
        caps["textDocumentSync"] = json{{"openClose", true}, {"change", 1}};  // Full sync
        caps["completionProvider"] = json{{"resolveProvider", false}};
        caps["hoverProvider"] = true;
        caps["definitionProvider"] = true;
        caps["referencesProvider"] = true;
        caps["documentSymbolProvider"] = true;
        caps["workspaceSymbolProvider"] = true;

        const json result = json{
          {"capabilities", caps}, {"serverInfo", json{{"name", k_server_name}}}};
        respond(msg["id"], result);
        continue;
      }

      if (method == "initialized") {
        log_line("initialized (position encoding {})", negotiated_position_encoding);
        continue;
      }

      if (method == "shutdown" && is_request) {
        respond(msg["id"], json());
        continue;
      }

      if (method == "exit") {
        running = false;
        continue;
      }

      if (method == "workspace/didChangeConfiguration") {
        apply_root_setting(root_file_setting(params.value("settings", json())));
        publish_all_diagnostics();
        continue;
      }

      if (method == "textDocument/didOpen") {
        if (!uri.empty()) {
          upsert_doc(uri, td.value("text", ""));
          publish_all_diagnostics();
        }
        continue;
      }

      if (method == "textDocument/didChange") {
        if (uri.empty()) {
          continue;
        }

        // Full sync: the last change holds the whole text.
        const auto changes = params.value("contentChanges", json::array());
        if (!changes.is_array() || changes.empty()) {
          continue;
        }
        const auto & c0 = changes.back();
        if (!c0.is_object() || !c0.contains("text") || !c0["text"].is_string()) {
          continue;
        }

        upsert_doc(uri, c0["text"].get<std::string>());
        publish_all_diagnostics();
        continue;
      }

      if (method == "textDocument/didClose") {
        if (!uri.empty()) {
          ws.remove_document(uri);
          docs.erase(uri);
          publish_all_diagnostics();
        }
        continue;
      }

      if (method == "textDocument/completion" && is_request) {
        const auto [line, character] =
          to_workspace_position(uri, params.value("position", json::object()));
        const json cj = json::parse(ws.completion_json(uri, line, character));

        json items = json::array();
        for (const auto & it0 : cj["items"]) {
          json item;
          item["label"] = it0.value("label", "");
          item["kind"] = completion_kind(it0.value("kind", "Text"));
          if (it0.contains("detail")) {
            item["detail"] = it0["detail"];
          }
          items.push_back(std::move(item));
        }

        respond(
          msg["id"], json{{"isIncomplete", cj.value("isIncomplete", false)}, {"items", items}});
        continue;
      }

      if (method == "textDocument/hover" && is_request) {
        const auto [line, character] =
          to_workspace_position(uri, params.value("position", json::object()));
        const json hj = json::parse(ws.hover_json(uri, line, character));

        if (!hj["contents"].is_string()) {
          respond(msg["id"], nullptr);
          continue;
        }

        json out;
        out["contents"] = json{{"kind", "markdown"}, {"value", hj["contents"]}};
        out["range"] = to_lsp_range(uri, hj["range"]);
        respond(msg["id"], out);
        continue;
      }

      if (
        (method == "textDocument/definition" || method == "textDocument/references") &&
        is_request) {
        const auto [line, character] =
          to_workspace_position(uri, params.value("position", json::object()));
        const json lj = json::parse(
          method == "textDocument/definition" ? ws.definition_json(uri, line, character)
                                              : ws.references_json(uri, line, character));

        json locs = json::array();
        for (const auto & loc : lj["locations"]) {
          locs.push_back(to_lsp_location(loc));
        }
        respond(msg["id"], locs);
        continue;
      }

      if (method == "textDocument/documentSymbol" && is_request) {
        const json sj = json::parse(ws.document_symbols_json(uri));

        json out = json::array();
        for (const auto & s0 : sj["symbols"]) {
          json ds;
          ds["name"] = s0.value("name", "");
          ds["kind"] = symbol_kind(s0.value("kind", ""));
          ds["range"] = to_lsp_range(uri, s0["range"]);
          ds["selectionRange"] = to_lsp_range(uri, s0["selectionRange"]);
          ds["children"] = json::array();
          out.push_back(std::move(ds));
        }

        respond(msg["id"], out);
        continue;
      }

      if (method == "workspace/symbol" && is_request) {
        const json sj = json::parse(ws.workspace_symbols_json(params.value("query", "")));

        json out = json::array();
        for (const auto & s0 : sj["symbols"]) {
          json si;
          si["name"] = s0.value("name", "");
          si["kind"] = symbol_kind(s0.value("kind", ""));
          si["location"] = to_lsp_location(s0["location"]);
          out.push_back(std::move(si));
        }

        respond(msg["id"], out);
        continue;
      }

      // Unknown method
      if (is_request) {
        respond_error(msg["id"], -32601, "Method not found");
      }
    }

    return 0;
  } catch (const std::exception & e) {
    std::cerr << k_server_name << ": fatal error: " << e.what() << "\n";
    return 1;
  }
}
