//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthrelay/CallbackServer.cpp
// Purpose: OAuth redirect endpoint using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <sstream>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "oauthrelay/CallbackPayload.h"
#include "oauthrelay/CallbackServer.hpp"
#include "oauthrelay/CodeExtractor.h"
#include "oauthrelay/errors/Errors.h"
#include "oauthrelay/version.h"

#include <openssl/ssl.h>

namespace oauthrelay {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr auto kRequestTimeout = std::chrono::seconds(30);

const char* const kSuccessPage =
    "<!DOCTYPE html>\n"
    "<html lang=\"en\">\n"
    "<head><meta charset=\"UTF-8\"><title>Authorization Complete</title></head>\n"
    "<body style=\"font-family: sans-serif; text-align: center; margin-top: 15vh;\">\n"
    "<h1>Authorization Complete</h1>\n"
    "<p>You can safely close this tab now.</p>\n"
    "</body>\n"
    "</html>\n";

const char* const kFailurePage =
    "<!DOCTYPE html>\n"
    "<html lang=\"en\">\n"
    "<head><meta charset=\"UTF-8\"><title>Authorization Failed</title></head>\n"
    "<body style=\"font-family: sans-serif; text-align: center; margin-top: 15vh;\">\n"
    "<h1>Authorization Failed</h1>\n"
    "<p>No client is waiting for this authorization. Please try again.</p>\n"
    "</body>\n"
    "</html>\n";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void trim(std::string& s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

// Decode a POST body according to its content type. Throws when the body cannot be decoded.
CallbackPayload payloadFromBody(const std::string& contentType, const std::string& body) {
    const std::string ct = toLower(contentType);
    if (ct.find("application/json") != std::string::npos) {
        return PayloadFromJSONBody(body);
    }
    if (ct.find("application/x-www-form-urlencoded") != std::string::npos) {
        return PayloadFromQueryString(body);
    }
    try {
        return PayloadFromJSONBody(body);
    } catch (const std::exception&) {
        return PayloadFromQueryString(body);
    }
}

// Correlation token of a payload. Scalar JSON states (numbers, booleans) are keyed by their text form;
// null, arrays and objects carry no usable token.
std::optional<std::string> stateOf(const CallbackPayload& payload) {
    const JSONValue* v = payload.Find("state");
    if (v == nullptr || v->isNull() || v->isArray() || v->isObject()) {
        return std::nullopt;
    }
    return CoerceToString(*v);
}

} // namespace

class CallbackServer::Impl {
public:
    CallbackServer::Options opts;
    IDeliverySink& sink;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    Impl(const CallbackServer::Options& o, IDeliverySink& s) : opts(o), sink(s) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void loadTls() {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
        // TLS 1.3 only
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        try {
            sslCtx->use_certificate_chain_file(opts.certFile);
            sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
        } catch (const std::exception& e) {
            throw errors::BindError(std::string("CallbackServer: failed to load certificate/key: ") + e.what());
        }
        sslCtx->set_options(
            ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
            ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
    }

    void bind() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty() ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; }) ||
            opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw errors::BindError("CallbackServer invalid port: '" + opts.port + "'");
        }
        if (opts.scheme == "https") {
            loadTls();
        } else if (opts.scheme != "http") {
            throw errors::BindError("CallbackServer unsupported scheme: " + opts.scheme);
        }

        boost::system::error_code ec;
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port, ec);
        if (ec || r.empty()) {
            throw errors::BindError("CallbackServer cannot resolve " + opts.address + ": " +
                                    (ec ? ec.message() : std::string("no addresses")));
        }
        tcp::endpoint ep = *r.begin();

        auto a = std::make_unique<tcp::acceptor>(ioc);
        a->open(ep.protocol(), ec);
        if (!ec) { a->set_option(tcp::acceptor::reuse_address(true), ec); }
        if (!ec) { a->bind(ep, ec); }
        if (!ec) { a->listen(net::socket_base::max_listen_connections, ec); }
        if (ec) {
            throw errors::BindError("CallbackServer cannot listen on " + opts.address + ":" + opts.port + ": " + ec.message());
        }
        boundPort.store(a->local_endpoint().port());
        acceptor = std::move(a);
    }

    http::response<http::string_body> htmlPage(const http::request<http::string_body>& req,
                                               http::status status, const char* page) {
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::content_type, "text/html; charset=utf-8");
        res.keep_alive(false);
        res.body() = page;
        res.prepare_payload();
        return res;
    }

    http::response<http::string_body> jsonReply(const http::request<http::string_body>& req,
                                                http::status status, const std::string& body) {
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);
        res.body() = body;
        res.prepare_payload();
        return res;
    }

    http::response<http::string_body> handleCallback(const http::request<http::string_body>& req,
                                                     const CallbackPayload& payload) {
        const std::optional<std::string> state = stateOf(payload);
        const std::optional<std::string> code = ExtractCode(payload, opts.codeKeys);
        std::optional<JSONValue> raw;
        if (!code.has_value()) {
            raw = payload.ToJSON();
        }
        LOG_INFO("CallbackServer: callback for state {} ({})", state.value_or("<none>"),
                 code ? "code present" : "no code");

        if (sink.DeliverResult(state, code, raw)) {
            return htmlPage(req, http::status::ok, kSuccessPage);
        }
        return htmlPage(req, http::status::not_found, kFailurePage);
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        const std::string target = std::string(req.target());
        const auto qpos = target.find('?');
        const std::string path = target.substr(0, qpos);
        const std::string query = (qpos == std::string::npos) ? std::string() : target.substr(qpos + 1);

        if (path == opts.callbackPath) {
            if (req.method() == http::verb::get) {
                return handleCallback(req, PayloadFromQueryString(query));
            }
            if (req.method() == http::verb::post) {
                CallbackPayload payload;
                try {
                    payload = payloadFromBody(std::string(req[http::field::content_type]), req.body());
                } catch (const std::exception& e) {
                    LOG_ERROR("CallbackServer: error parsing callback body: {}", e.what());
                    return htmlPage(req, http::status::bad_request, kFailurePage);
                }
                return handleCallback(req, payload);
            }
            auto res = jsonReply(req, http::status::method_not_allowed, "{\"error\":\"Method not allowed\"}");
            res.set(http::field::allow, "GET, POST");
            return res;
        }

        if (req.method() == http::verb::get && path == "/health") {
            return jsonReply(req, http::status::ok, "{\"status\":\"ok\"}");
        }
        if (req.method() == http::verb::get && path == "/") {
            JSONValue::Object info;
            info["service"] = std::make_shared<JSONValue>("oauth-relay");
            info["version"] = std::make_shared<JSONValue>(getVersionString());
            info["status"] = std::make_shared<JSONValue>("running");
            return jsonReply(req, http::status::ok, SerializeJSON(JSONValue(std::move(info))));
        }
        return jsonReply(req, http::status::not_found, "{\"error\":\"Not found\"}");
    }

    template <typename Stream>
    net::awaitable<void> serveOne(Stream& stream) {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        beast::get_lowest_layer(stream).expires_after(kRequestTimeout);
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        auto res = makeResponse(req);
        beast::get_lowest_layer(stream).expires_after(kRequestTimeout);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    void reportSessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
#ifdef _DEBUG
            LOG_DEBUG("CallbackServer {} session suppressed during shutdown: {}", kind, e.what());
#endif
            return;
        }
        LOG_WARN("CallbackServer {} session error: {}", kind, e.what());
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            beast::tcp_stream stream(std::move(socket));
            co_await serveOne(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            reportSessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<beast::tcp_stream> tls(beast::tcp_stream(std::move(socket)), *sslCtx);
            beast::get_lowest_layer(tls).expires_after(kRequestTimeout);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            reportSessionError("TLS", e);
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        while (running.load()) {
            boost::system::error_code ec;
            tcp::socket socket = co_await acceptor->async_accept(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (!running.load() || ec == net::error::operation_aborted) {
                    break;
                }
                LOG_WARN("CallbackServer accept error: {}", ec.message());
                continue;
            }
            if (opts.scheme == "https") {
                net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
            } else {
                net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
            }
        }
        co_return;
    }
};

CallbackServer::CallbackServer(const Options& opts, IDeliverySink& sink)
    : pImpl(std::make_unique<Impl>(opts, sink)) {}

CallbackServer::~CallbackServer() = default;

std::future<void> CallbackServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->ioThread.joinable()) {
        ready.set_exception(std::make_exception_ptr(errors::BindError("CallbackServer is already running")));
        return fut;
    }
    try {
        pImpl->ioc.restart();
        pImpl->bind();
    } catch (const errors::BindError& e) {
        LOG_ERROR("{}", e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("CallbackServer I/O thread terminated: {}", e.what());
        }
    });
    LOG_INFO("CallbackServer listening on {}://{}:{}{}", pImpl->opts.scheme, pImpl->opts.address,
             pImpl->boundPort.load(), pImpl->opts.callbackPath);
    ready.set_value();
    return fut;
}

std::future<void> CallbackServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec; pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    pImpl->acceptor.reset();
    pImpl->boundPort.store(0);
    done.set_value();
    return fut;
}

unsigned short CallbackServer::GetBoundPort() const {
    return pImpl->boundPort.load();
}

CallbackServer::Options ParseListenUri(const std::string& uri, CallbackServer::Options opts) {
    std::string cfg = uri;
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
    }
    trim(hostPort);

    // host[:port], IPv6 as [addr]:port
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : PercentDecode(kv.substr(eq + 1));
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

} // namespace oauthrelay
