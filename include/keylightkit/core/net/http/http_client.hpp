/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/url/url.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <queue>
#include <string>
#include <string_view>

namespace klk {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

/**
 * A wrapper around boost::beast for making HTTP requests. Requests are queued and sent one after the other over a
 * single connection, which is re-established when the server closes it.
 */
class HttpClient {
  public:
    /// When no port is specified in the urls, the default port is used.
    static constexpr auto k_default_port = "80";

    /// The default timeout for connecting, sending and receiving.
    static constexpr auto k_default_timeout = std::chrono::milliseconds(5000);

    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;

    /// Callback type for async requests.
    using CallbackType = std::function<void(boost::system::result<Response> response)>;

    /**
     * Constructs a new HttpClient using the given io_context and the host and port of the url. The path of the url is
     * not used, requests name their own target.
     * @param io_context The io_context to use for the requests.
     * @param url The url of the host.
     * @param timeout The timeout for each step of a request.
     */
    HttpClient(
        boost::asio::io_context& io_context, const boost::urls::url& url,
        std::chrono::milliseconds timeout = k_default_timeout
    );

    /**
     * Constructs a new HttpClient using the given io_context, address and port.
     * @param io_context The io_context to use for the requests.
     * @param address The address of the host.
     * @param port The port of the host.
     * @param timeout The timeout for each step of a request.
     */
    HttpClient(
        boost::asio::io_context& io_context, const boost::asio::ip::address& address, uint16_t port,
        std::chrono::milliseconds timeout = k_default_timeout
    );

    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpClient(HttpClient&&) = delete;
    HttpClient& operator=(HttpClient&&) = delete;

    /**
     * Asynchronous GET request.
     * The callback's lifetime will be tied to the io_context so make sure referenced objects are kept alive until the
     * callback is called.
     * @param target The target to request.
     * @param callback The callback to call when the request is complete.
     */
    void get_async(std::string_view target, CallbackType callback);

    /**
     * Asynchronous PUT request.
     * @param target The target to request.
     * @param body The body to send.
     * @param callback The callback to call when the request is complete.
     * @param content_type The content type of the body.
     */
    void put_async(
        std::string_view target, std::string body, CallbackType callback,
        std::string_view content_type = "application/json"
    );

    /**
     * Asynchronous request.
     * @param method The HTTP method to use for the request.
     * @param target The target to request.
     * @param body The optional body to send with the request.
     * @param content_type The content type of the body, only used when there is a body.
     * @param callback The callback to call when the request is complete.
     */
    void request_async(
        http::verb method, std::string_view target, std::string body, std::string_view content_type,
        CallbackType callback
    );

    /**
     * Clears all scheduled requests if there are any. Otherwise, this function has no effect.
     */
    void cancel_outstanding_requests();

    /**
     * @return The host requests are sent to.
     */
    [[nodiscard]] const std::string& get_host() const;

    /**
     * @return The service (port) requests are sent to.
     */
    [[nodiscard]] const std::string& get_service() const;

  private:
    /**
     * A session class that keeps itself alive and handles the connection and request/response cycle.
     */
    class Session: public std::enable_shared_from_this<Session> {
      public:
        enum class State {
            disconnected,
            resolving,
            connecting,
            connected,
            waiting_for_send,
            waiting_for_response,
        };

        Session(boost::asio::io_context& io_context, HttpClient* owner, std::chrono::milliseconds timeout);

        void send_requests();
        void clear_owner();

      private:
        HttpClient* owner_ = nullptr;
        std::chrono::milliseconds timeout_;
        tcp::resolver resolver_;
        boost::beast::tcp_stream stream_;
        Response response_;
        boost::beast::flat_buffer buffer_;
        State state_ = State::disconnected;

        void async_connect();
        void async_send();
        void close();
        void fail_front_request(const boost::beast::error_code& ec);

        /// @returns True if the client is still around and has a request in flight.
        [[nodiscard]] bool is_waiting_for_response() const;

        void on_resolve(const boost::beast::error_code& ec, const tcp::resolver::results_type& results);
        void on_connect(const boost::beast::error_code& ec, const tcp::resolver::results_type::endpoint_type&);
        void on_write(const boost::beast::error_code& ec, std::size_t bytes_transferred);
        void on_read(const boost::beast::error_code& ec, std::size_t bytes_transferred);
    };

    boost::asio::io_context& io_context_;
    std::chrono::milliseconds timeout_;
    std::string host_;
    std::string service_;
    std::queue<std::pair<Request, CallbackType>> requests_;
    std::shared_ptr<Session> session_;
};

}  // namespace klk
