#include "kube_client.hpp"

#include <curl/curl.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <exception>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace releaselog::cluster {

namespace {

constexpr char kServiceAccountDir[] = "/var/run/secrets/kubernetes.io/serviceaccount";

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlList   = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void EnsureCurlInitialized() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string ReadFileTrimmed(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::ClusterError("cannot read " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  auto content = buffer.str();
  while (!content.empty() && (content.back() == '\n' || content.back() == '\r' || content.back() == ' ')) {
    content.pop_back();
  }
  return content;
}

std::string PercentEncode(std::string_view value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string           out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

size_t AppendBody(char* data, size_t size, size_t count, void* user) {
  static_cast<std::string*>(user)->append(data, size * count);
  return size * count;
}

struct StreamState {
  const LineHandler*              on_line = nullptr;
  const util::CancellationScope*  scope   = nullptr;
  std::string                     pending;
  std::exception_ptr              handler_error;
};

size_t SplitLines(char* data, size_t size, size_t count, void* user) {
  auto*        state = static_cast<StreamState*>(user);
  const size_t bytes = size * count;
  if (state->scope->IsCancelled()) return 0;

  state->pending.append(data, bytes);
  try {
    std::size_t start = 0;
    for (auto nl = state->pending.find('\n'); nl != std::string::npos; nl = state->pending.find('\n', start)) {
      std::string_view line(state->pending.data() + start, nl - start);
      if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
      (*state->on_line)(line);
      start = nl + 1;
    }
    state->pending.erase(0, start);
  } catch (...) {
    // never unwind through libcurl
    state->handler_error = std::current_exception();
    return 0;
  }
  return bytes;
}

int AbortWhenCancelled(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  return static_cast<StreamState*>(user)->scope->IsCancelled() ? 1 : 0;
}

std::string ErrorMessageFromBody(const std::string& body) {
  google::protobuf::Struct parsed;
  if (google::protobuf::util::JsonStringToMessage(body, &parsed).ok()) {
    auto it = parsed.fields().find("message");
    if (it != parsed.fields().end() && it->second.kind_case() == google::protobuf::Value::kStringValue) {
      return it->second.string_value();
    }
  }
  return body.size() > 256 ? body.substr(0, 256) + "..." : body;
}

CurlHandle NewHandle(const KubeClientOptions& options, const std::string& url, curl_slist* headers) {
  CurlHandle handle(curl_easy_init(), &curl_easy_cleanup);
  if (!handle) {
    throw util::ClusterError("curl_easy_init failed");
  }
  CURL* c = handle.get();
  curl_easy_setopt(c, CURLOPT_URL, url.c_str());
  curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.request_timeout.count()));
  if (!options.ca_file.empty()) {
    curl_easy_setopt(c, CURLOPT_CAINFO, options.ca_file.c_str());
  }
  if (options.insecure_skip_tls_verify) {
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, 0L);
  }
  return handle;
}

CurlList BuildHeaders(const KubeClientOptions& options) {
  curl_slist* headers = curl_slist_append(nullptr, "Accept: application/json");
  if (!options.bearer_token.empty()) {
    const std::string auth = "Authorization: Bearer " + options.bearer_token;
    headers                = curl_slist_append(headers, auth.c_str());
  }
  return CurlList(headers, &curl_slist_free_all);
}

void ThrowForStatus(long status, std::string_view path, const std::string& message) {
  const std::string what = "GET " + std::string(path) + ": HTTP " + std::to_string(status) + (message.empty() ? "" : ": " + message);
  if (status == 404) {
    throw util::NotFound(what);
  }
  throw util::ClusterError(what, status);
}

} // namespace

KubeClientOptions ResolveKubeClientOptions(const releaselog::runtime::config::ClusterConfig& config) {
  KubeClientOptions options;
  options.insecure_skip_tls_verify = config.insecure_skip_tls_verify();
  if (config.request_timeout_ms() > 0) {
    options.request_timeout = std::chrono::milliseconds(config.request_timeout_ms());
  }

  if (!config.api_server().empty()) {
    options.api_server = config.api_server();
  } else {
    const char* host = std::getenv("KUBERNETES_SERVICE_HOST");
    const char* port = std::getenv("KUBERNETES_SERVICE_PORT");
    if (!host || !port) {
      throw util::ClusterError("cluster.api_server is not set and KUBERNETES_SERVICE_HOST/PORT are missing");
    }
    const std::string h(host);
    options.api_server = "https://" + (h.find(':') != std::string::npos ? "[" + h + "]" : h) + ":" + port;
  }

  const std::string sa_dir(kServiceAccountDir);
  const auto        token_file = !config.token_file().empty() ? config.token_file() : (config.api_server().empty() ? sa_dir + "/token" : "");
  if (!token_file.empty()) {
    options.bearer_token = ReadFileTrimmed(token_file);
  }

  if (!config.ca_file().empty()) {
    options.ca_file = config.ca_file();
  } else if (config.api_server().empty()) {
    options.ca_file = sa_dir + "/ca.crt";
  }

  return options;
}

KubeClient::KubeClient(KubeClientOptions options) : options_(std::move(options)) {
  EnsureCurlInitialized();
  while (!options_.api_server.empty() && options_.api_server.back() == '/') {
    options_.api_server.pop_back();
  }
}

std::string KubeClient::BuildUrl(std::string_view path, const QueryParams& query) const {
  std::string url = options_.api_server;
  url.append(path);
  char separator = '?';
  for (const auto& [key, value] : query) {
    url.push_back(separator);
    url.append(PercentEncode(key)).append("=").append(PercentEncode(value));
    separator = '&';
  }
  return url;
}

google::protobuf::Struct KubeClient::GetJson(std::string_view path, const QueryParams& query) const {
  const auto url     = BuildUrl(path, query);
  auto       headers = BuildHeaders(options_);
  auto       handle  = NewHandle(options_, url, headers.get());

  std::string body;
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, AppendBody);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.request_timeout.count()));

  const auto rc = curl_easy_perform(handle.get());
  if (rc != CURLE_OK) {
    throw util::ClusterError("GET " + std::string(path) + ": " + curl_easy_strerror(rc));
  }

  long status = 0;
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status >= 400) {
    ThrowForStatus(status, path, ErrorMessageFromBody(body));
  }

  google::protobuf::Struct result;
  auto                     parse_status = google::protobuf::util::JsonStringToMessage(body, &result);
  if (!parse_status.ok()) {
    throw util::ClusterError("GET " + std::string(path) + ": invalid JSON: " + std::string(parse_status.message()));
  }
  return result;
}

void KubeClient::StreamLines(std::string_view path, const QueryParams& query, const util::CancellationScope& scope,
                             const LineHandler& on_line) const {
  const auto url     = BuildUrl(path, query);
  auto       headers = BuildHeaders(options_);
  auto       handle  = NewHandle(options_, url, headers.get());

  StreamState state;
  state.on_line = &on_line;
  state.scope   = &scope;

  CURL* c = handle.get();
  curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, SplitLines);
  curl_easy_setopt(c, CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, AbortWhenCancelled);
  curl_easy_setopt(c, CURLOPT_XFERINFODATA, &state);
  curl_easy_setopt(c, CURLOPT_FAILONERROR, 1L);
  // follow streams stay open indefinitely; only the connect phase is bounded
  curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, 0L);

  const auto rc = curl_easy_perform(c);

  if (state.handler_error) {
    std::rethrow_exception(state.handler_error);
  }
  if (scope.IsCancelled()) {
    return;
  }

  if (rc == CURLE_HTTP_RETURNED_ERROR) {
    long status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);
    ThrowForStatus(status, path, "");
  }
  if (rc != CURLE_OK) {
    throw util::ClusterError("GET " + std::string(path) + ": " + curl_easy_strerror(rc));
  }

  if (!state.pending.empty()) {
    std::string_view tail(state.pending);
    if (tail.back() == '\r') tail.remove_suffix(1);
    on_line(tail);
  }
}

} // namespace releaselog::cluster
