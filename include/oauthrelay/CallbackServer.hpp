//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CallbackServer.hpp
// Purpose: HTTP/HTTPS endpoint receiving OAuth provider redirects (Boost.Beast, TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "oauthrelay/Coordinator.hpp"

namespace oauthrelay {

  //==========================================================================================================
  // CallbackServer
  // Purpose: Turns provider redirects into DeliverResult calls on an IDeliverySink and answers the browser
  //          with a terminal HTML page.
  // Notes:
  //   - GET <callbackPath>: payload from the query string.
  //   - POST <callbackPath>: JSON body, urlencoded form body, or (other content types) JSON with a form fallback.
  //   - GET /health and GET / answer JSON for probes; other methods on the callback path get 405.
  //   - The sink is a non-owning reference; the caller keeps it alive until Stop() has completed.
  //==========================================================================================================
  class CallbackServer {
  public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8000, "0" picks an ephemeral port)
    //   callbackPath: Path receiving provider redirects
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   codeKeys: Candidate payload keys holding the authorization code, in priority order
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8000"};
        std::string callbackPath{"/oauth/callback"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::vector<std::string> codeKeys{"code", "authorization_code"};
    };

    CallbackServer(const Options& opts, IDeliverySink& sink);
    ~CallbackServer();

    CallbackServer(const CallbackServer&) = delete;
    CallbackServer& operator=(const CallbackServer&) = delete;

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once accepting. Holds errors::BindError when the address cannot be bound,
    //   the port is invalid or the TLS certificate/key cannot be loaded.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes the acceptor, stops the I/O context and joins the background thread.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    // Actual listening port once started; 0 before Start().
    unsigned short GetBoundPort() const;

  private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // ParseListenUri
  // Purpose: Build Options from a listen URI. Fields not present in the URI keep their defaults.
  //            - "http://<address>:<port>" (e.g., http://127.0.0.1:0)
  //            - "https://<address>:<port>?cert=<pem>&key=<pem>"
  //            - "[::1]:8080" (scheme omitted: http)
  //          Unknown query parameters are ignored.
  //==========================================================================================================
  CallbackServer::Options ParseListenUri(const std::string& uri, CallbackServer::Options base = {});

} // namespace oauthrelay
