#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

#ifndef BFF_LSP_SERVER_PATH
#define BFF_LSP_SERVER_PATH "bff_lsp_server"
#endif

namespace
{
struct LspPos
{
  int line = 0;
  int character = 0;  // UTF-16 code units
};

std::pair<uint32_t, size_t> decode_utf8(std::string_view s, size_t i)
{
  const unsigned char b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80) return {b0, 1};
  if ((b0 & 0xE0) == 0xC0 && i + 1 < s.size()) {
    const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
    if ((b1 & 0xC0) == 0x80) {
      return {((b0 & 0x1F) << 6) | (b1 & 0x3F), 2};
    }
  }
  if ((b0 & 0xF0) == 0xE0 && i + 2 < s.size()) {
    const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
    const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
    if (((b1 & 0xC0) == 0x80) && ((b2 & 0xC0) == 0x80)) {
      return {((b0 & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F), 3};
    }
  }
  if ((b0 & 0xF8) == 0xF0 && i + 3 < s.size()) {
    const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
    const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
    const unsigned char b3 = static_cast<unsigned char>(s[i + 3]);
    if (((b1 & 0xC0) == 0x80) && ((b2 & 0xC0) == 0x80) && ((b3 & 0xC0) == 0x80)) {
      const uint32_t cp = ((b0 & 0x07) << 18) | ((b1 & 0x3F) << 12) | ((b2 & 0x3F) << 6) |
                          (b3 & 0x3F);
      return {cp, 4};
    }
  }
  return {0xFFFDu, 1};
}

int utf16_units(uint32_t cp) { return (cp > 0xFFFFu) ? 2 : 1; }

LspPos lsp_pos_at_utf8_byte(std::string_view text, size_t target_byte)
{
  LspPos pos;
  size_t i = 0;
  while (i < text.size() && i < target_byte) {
    const auto [cp, consumed] = decode_utf8(text, i);
    if (i + consumed > target_byte) break;
    i += consumed;

    if (cp == '\n') {
      pos.line += 1;
      pos.character = 0;
    } else {
      pos.character += utf16_units(cp);
    }
  }
  return pos;
}

std::string to_file_uri(const fs::path & p)
{
  const fs::path abs = fs::absolute(p);
  return std::string("file://") + abs.string();
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = fs::temp_directory_path() / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

struct Proc
{
  pid_t pid = -1;
  int in_fd = -1;   // parent writes to child's stdin
  int out_fd = -1;  // parent reads from child's stdout
};

bool write_all(int fd, const void * data, size_t n)
{
  const auto * p = static_cast<const uint8_t *>(data);
  size_t off = 0;
  while (off < n) {
    const ssize_t w = ::write(fd, p + off, n - off);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<size_t>(w);
  }
  return true;
}

bool wait_readable(int fd, int timeout_ms)
{
  for (;;) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr < 0 && errno == EINTR) continue;
    return pr > 0;
  }
}

std::optional<std::string> read_exact_with_timeout(int fd, size_t n, int timeout_ms)
{
  std::string out(n, '\0');
  size_t off = 0;
  while (off < n) {
    if (!wait_readable(fd, timeout_ms)) return std::nullopt;
    const ssize_t r = ::read(fd, out.data() + off, n - off);
    if (r < 0) {
      if (errno == EINTR) continue;
      return std::nullopt;
    }
    if (r == 0) return std::nullopt;
    off += static_cast<size_t>(r);
  }
  return out;
}

std::optional<std::string> read_line_with_timeout(int fd, int timeout_ms)
{
  std::string line;
  char c = 0;
  for (;;) {
    if (!wait_readable(fd, timeout_ms)) return std::nullopt;
    const ssize_t r = ::read(fd, &c, 1);
    if (r < 0) {
      if (errno == EINTR) continue;
      return std::nullopt;
    }
    if (r == 0) return std::nullopt;

    if (c == '\n') break;
    if (c != '\r') line.push_back(c);
  }
  return line;
}

std::optional<json> read_framed_json(int fd, int timeout_ms)
{
  int content_length = -1;

  // headers
  for (;;) {
    const auto line_opt = read_line_with_timeout(fd, timeout_ms);
    if (!line_opt) return std::nullopt;
    const std::string line = *line_opt;
    if (line.empty()) break;

    const std::string key = "Content-Length:";
    if (line.rfind(key, 0) == 0) {
      std::string rest = line.substr(key.size());
      while (!rest.empty() && (rest[0] == ' ' || rest[0] == '\t')) rest.erase(rest.begin());
      content_length = std::atoi(rest.c_str());
    }
  }

  if (content_length <= 0) return std::nullopt;

  const auto body_opt =
    read_exact_with_timeout(fd, static_cast<size_t>(content_length), timeout_ms);
  if (!body_opt) return std::nullopt;

  return json::parse(*body_opt, nullptr, false);
}

class LspServer
{
public:
  explicit LspServer(json initialization_options = json::object())
  {
    proc_ = spawn();
    if (proc_.pid <= 0 || proc_.in_fd < 0 || proc_.out_fd < 0) {
      throw std::runtime_error("Failed to spawn bff_lsp_server");
    }

    json params;
    params["processId"] = nullptr;
    params["rootUri"] = nullptr;
    params["capabilities"] = json{
      {"textDocument", json{{"publishDiagnostics", json{{"relatedInformation", true}}}}}};
    params["initializationOptions"] = std::move(initialization_options);

    const json resp = request("initialize", params);
    if (!resp.contains("result")) {
      throw std::runtime_error("initialize did not return a result");
    }
    init_result_ = resp["result"];

    notify("initialized", json::object());
  }

  ~LspServer()
  {
    if (proc_.pid <= 0) return;

    if (send_payload_no_throw(make_request("shutdown", json::object()))) {
      (void)read_framed_json(proc_.out_fd, 500);
      (void)send_payload_no_throw(make_notification("exit", json::object()));
    }

    int status = 0;
    for (int i = 0; i < 20; i++) {
      const pid_t r = ::waitpid(proc_.pid, &status, WNOHANG);
      if (r == proc_.pid) {
        cleanup_fds();
        proc_.pid = -1;
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ::kill(proc_.pid, SIGKILL);
    (void)::waitpid(proc_.pid, &status, 0);
    cleanup_fds();
  }

  LspServer(const LspServer &) = delete;
  LspServer & operator=(const LspServer &) = delete;

  const json & init_result() const { return init_result_; }

  void did_open(const std::string & uri, const std::string & text, int version = 1)
  {
    json td;
    td["uri"] = uri;
    td["languageId"] = "fastbuild";
    td["version"] = version;
    td["text"] = text;
    notify("textDocument/didOpen", json{{"textDocument", td}});
  }

  void did_change(const std::string & uri, const std::string & text, int version)
  {
    notify(
      "textDocument/didChange",
      json{
        {"textDocument", json{{"uri", uri}, {"version", version}}},
        {"contentChanges", json::array({json{{"text", text}}})}});
  }

  json at_position(
    const std::string & method, const std::string & uri, const std::string & text,
    size_t byte_off)
  {
    const auto pos = lsp_pos_at_utf8_byte(text, byte_off);
    json params;
    params["textDocument"] = json{{"uri", uri}};
    params["position"] = json{{"line", pos.line}, {"character", pos.character}};
    if (method == "textDocument/references") {
      params["context"] = json{{"includeDeclaration", true}};
    }
    return request(method, params);
  }

  json request(const std::string & method, json params)
  {
    const json msg = make_request(method, std::move(params));
    send_payload(msg);

    const int id = msg["id"].get<int>();
    for (;;) {
      const auto resp_opt = read_framed_json(proc_.out_fd, 2000);
      if (!resp_opt.has_value() || resp_opt->is_discarded()) {
        throw std::runtime_error("Timed out waiting for JSON-RPC response");
      }
      const json & resp = *resp_opt;
      if (resp.contains("id") && resp["id"].is_number_integer() && resp["id"].get<int>() == id) {
        return resp;
      }
      // ignore notifications/other responses
    }
  }

  /// Next publishDiagnostics notification for `uri`.
  std::optional<json> wait_for_diagnostics(const std::string & uri, int timeout_ms = 2000)
  {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
      const auto msg = read_framed_json(proc_.out_fd, 200);
      if (!msg || msg->is_discarded()) continue;
      if (
        msg->value("method", "") == "textDocument/publishDiagnostics" &&
        (*msg)["params"].value("uri", "") == uri) {
        return (*msg)["params"];
      }
    }
    return std::nullopt;
  }

private:
  static Proc spawn()
  {
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    Proc p;

    if (::pipe(in_pipe) != 0) return p;
    if (::pipe(out_pipe) != 0) {
      ::close(in_pipe[0]);
      ::close(in_pipe[1]);
      return p;
    }

    const pid_t pid = ::fork();
    if (pid == 0) {
      // child
      ::dup2(in_pipe[0], STDIN_FILENO);
      ::dup2(out_pipe[1], STDOUT_FILENO);

      ::close(in_pipe[0]);
      ::close(in_pipe[1]);
      ::close(out_pipe[0]);
      ::close(out_pipe[1]);

      const char * argv0 = BFF_LSP_SERVER_PATH;
      char * const argv[] = {const_cast<char *>(argv0), nullptr};
      ::execv(argv0, argv);

      std::perror("execv");
      _exit(127);
    }

    // parent
    p.pid = pid;
    p.in_fd = in_pipe[1];
    p.out_fd = out_pipe[0];
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    return p;
  }

  void cleanup_fds()
  {
    if (proc_.in_fd >= 0) {
      ::close(proc_.in_fd);
      proc_.in_fd = -1;
    }
    if (proc_.out_fd >= 0) {
      ::close(proc_.out_fd);
      proc_.out_fd = -1;
    }
  }

  json make_request(const std::string & method, json params)
  {
    return json{
      {"jsonrpc", "2.0"}, {"id", next_id_++}, {"method", method}, {"params", std::move(params)}};
  }

  static json make_notification(const std::string & method, json params)
  {
    return json{{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}};
  }

  bool send_payload_no_throw(const json & payload)
  {
    const std::string body = payload.dump();
    std::ostringstream oss;
    oss << "Content-Length: " << body.size() << "\r\n\r\n" << body;
    const std::string framed = oss.str();
    return write_all(proc_.in_fd, framed.data(), framed.size());
  }

  void send_payload(const json & payload)
  {
    if (!send_payload_no_throw(payload)) {
      throw std::runtime_error("Failed to write JSON-RPC message");
    }
  }

  void notify(const std::string & method, json params)
  {
    send_payload(make_notification(method, std::move(params)));
  }

  Proc proc_;
  json init_result_;
  int next_id_ = 1;
};

}  // namespace

TEST(LspServerJsonRpcTest, InitializeReportsCapabilities)
{
  LspServer srv;
  const auto & caps = srv.init_result()["capabilities"];
  EXPECT_EQ(caps["positionEncoding"], "utf-16");
  EXPECT_TRUE(caps["hoverProvider"].get<bool>());
  EXPECT_TRUE(caps["definitionProvider"].get<bool>());
  EXPECT_TRUE(caps["referencesProvider"].get<bool>());
  EXPECT_TRUE(caps["workspaceSymbolProvider"].get<bool>());
  EXPECT_EQ(srv.init_result()["serverInfo"]["name"], "bff_lsp_server");
}

TEST(LspServerJsonRpcTest, PublishDiagnosticsOnDidOpen)
{
  LspServer srv;

  const fs::path dir = make_temp_dir("bff_lsp_diag");
  const std::string uri = to_file_uri(dir / "fbuild.bff");

  srv.did_open(uri, ".A = .Missing\n");

  const auto params = srv.wait_for_diagnostics(uri);
  ASSERT_TRUE(params.has_value());
  ASSERT_EQ((*params)["diagnostics"].size(), 1u);

  const auto & d = (*params)["diagnostics"][0];
  EXPECT_EQ(d["source"], "FASTBuild");
  EXPECT_EQ(d["severity"], 1);
  EXPECT_NE(d["message"].get<std::string>().find("\"Missing\""), std::string::npos);
  EXPECT_EQ(d["range"]["start"]["line"], 0);
  EXPECT_EQ(d["range"]["start"]["character"], 5);
}

TEST(LspServerJsonRpcTest, FixingTheDocumentClearsDiagnostics)
{
  LspServer srv;

  const fs::path dir = make_temp_dir("bff_lsp_fix");
  const std::string uri = to_file_uri(dir / "fbuild.bff");

  srv.did_open(uri, ".A = .Missing\n");
  const auto before = srv.wait_for_diagnostics(uri);
  ASSERT_TRUE(before.has_value());
  EXPECT_FALSE((*before)["diagnostics"].empty());

  srv.did_change(uri, ".Missing = 1\n.A = .Missing\n", 2);
  const auto after = srv.wait_for_diagnostics(uri);
  ASSERT_TRUE(after.has_value());
  EXPECT_TRUE((*after)["diagnostics"].empty());
}

TEST(LspServerJsonRpcTest, HoverConvertsUtf16Columns)
{
  LspServer srv;

  const fs::path dir = make_temp_dir("bff_lsp_hover");
  const std::string uri = to_file_uri(dir / "fbuild.bff");
  const std::string text = ".A = 'x'\n.B = '\xC3\xBC' + .A\n";

  srv.did_open(uri, text);

  const size_t ref = text.rfind(".A");
  const json resp = srv.at_position("textDocument/hover", uri, text, ref + 1);
  ASSERT_TRUE(resp["result"].is_object());

  const auto & result = resp["result"];
  EXPECT_EQ(result["contents"]["kind"], "markdown");
  EXPECT_NE(result["contents"]["value"].get<std::string>().find("\"x\""), std::string::npos);
  EXPECT_EQ(result["range"]["start"]["line"], 1);
  EXPECT_EQ(result["range"]["start"]["character"], 11);
  EXPECT_EQ(result["range"]["end"]["character"], 13);
}

TEST(LspServerJsonRpcTest, DefinitionResolvesIntoIncludedFile)
{
  LspServer srv;

  const fs::path dir = make_temp_dir("bff_lsp_include");
  {
    std::ofstream out(dir / "common.bff");
    out << ".Shared = 'yes'\n";
  }

  const std::string uri = to_file_uri(dir / "fbuild.bff");
  const std::string text = "#include \"common.bff\"\n.Use = .Shared\n";
  srv.did_open(uri, text);

  const json resp =
    srv.at_position("textDocument/definition", uri, text, text.rfind(".Shared") + 2);
  ASSERT_TRUE(resp["result"].is_array());
  ASSERT_EQ(resp["result"].size(), 1u);
  EXPECT_EQ(resp["result"][0]["uri"], to_file_uri(dir / "common.bff"));
  EXPECT_EQ(resp["result"][0]["range"]["start"]["line"], 0);
  EXPECT_EQ(resp["result"][0]["range"]["start"]["character"], 0);
}

TEST(LspServerJsonRpcTest, ReferencesListEveryUse)
{
  LspServer srv;

  const fs::path dir = make_temp_dir("bff_lsp_refs");
  const std::string uri = to_file_uri(dir / "fbuild.bff");
  const std::string text = ".A = 1\n.B = .A\n.C = .A\n";
  srv.did_open(uri, text);

  const json resp = srv.at_position("textDocument/references", uri, text, 1);
  ASSERT_TRUE(resp["result"].is_array());
  EXPECT_EQ(resp["result"].size(), 3u);
}

TEST(LspServerJsonRpcTest, CompletionOffersFunctionProperties)
{
  LspServer srv;

  const fs::path dir = make_temp_dir("bff_lsp_completion");
  const std::string uri = to_file_uri(dir / "fbuild.bff");
  const std::string text = "Alias('All')\n{\n  \n}\n";
  srv.did_open(uri, text);

  const json resp =
    srv.at_position("textDocument/completion", uri, text, text.find("\n  \n") + 3);
  ASSERT_TRUE(resp["result"].contains("items"));

  bool saw_targets = false;
  for (const auto & item : resp["result"]["items"]) {
    if (item["label"] == ".Targets") {
      saw_targets = true;
      EXPECT_EQ(item["kind"], 10);
      EXPECT_EQ(item["detail"], "Required: true");
    }
  }
  EXPECT_TRUE(saw_targets);
}

TEST(LspServerJsonRpcTest, DocumentSymbolsUseLspKinds)
{
  LspServer srv;

  const fs::path dir = make_temp_dir("bff_lsp_symbols");
  const std::string uri = to_file_uri(dir / "fbuild.bff");
  const std::string text = ".List = {}\nAlias('All') { .Targets = .List }\n";
  srv.did_open(uri, text);

  const json resp = srv.request("textDocument/documentSymbol", json{{"textDocument", {{"uri", uri}}}});
  ASSERT_TRUE(resp["result"].is_array());
  ASSERT_FALSE(resp["result"].empty());
  EXPECT_EQ(resp["result"][0]["name"], "All");
  EXPECT_EQ(resp["result"][0]["kind"], 12);
}

TEST(LspServerJsonRpcTest, RootFileSettingErrorIsPublished)
{
  LspServer srv(json{{"fastbuild", json{{"rootFile", "relative/fbuild.bff"}}}});

  const fs::path dir = make_temp_dir("bff_lsp_root_setting");
  const std::string uri = to_file_uri(dir / "fbuild.bff");
  srv.did_open(uri, ".A = 1\n");

  const auto params = srv.wait_for_diagnostics(uri);
  ASSERT_TRUE(params.has_value());
  ASSERT_EQ((*params)["diagnostics"].size(), 1u);
  EXPECT_NE(
    (*params)["diagnostics"][0]["message"].get<std::string>().find("\"Root File\""),
    std::string::npos);
}

TEST(LspServerJsonRpcTest, UnknownRequestIsRejected)
{
  LspServer srv;
  const json resp = srv.request("textDocument/formatting", json::object());
  ASSERT_TRUE(resp.contains("error"));
  EXPECT_EQ(resp["error"]["code"], -32601);
}
