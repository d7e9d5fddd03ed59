/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/core/net/http/http_client.hpp"

#include "keylightkit/core/assert.hpp"
#include "keylightkit/core/log.hpp"

#include <utility>

klk::HttpClient::HttpClient(
    boost::asio::io_context& io_context, const boost::urls::url& url, const std::chrono::milliseconds timeout
) :
    io_context_(io_context), timeout_(timeout) {
    // An IPv6 host comes with brackets in a url, which the resolver doesn't accept.
    if (url.host_type() == boost::urls::host_type::ipv6) {
        host_ = url.host_ipv6_address().to_string();
    } else {
        host_ = url.host();
    }
    service_ = url.port();
}

klk::HttpClient::HttpClient(
    boost::asio::io_context& io_context, const boost::asio::ip::address& address, const uint16_t port,
    const std::chrono::milliseconds timeout
) :
    io_context_(io_context), timeout_(timeout), host_(address.to_string()), service_(std::to_string(port)) {}

klk::HttpClient::~HttpClient() {
    if (session_) {
        session_->clear_owner();
    }
}

void klk::HttpClient::get_async(const std::string_view target, CallbackType callback) {
    request_async(http::verb::get, target, {}, {}, std::move(callback));
}

void klk::HttpClient::put_async(
    const std::string_view target, std::string body, CallbackType callback, const std::string_view content_type
) {
    request_async(http::verb::put, target, std::move(body), content_type, std::move(callback));
}

void klk::HttpClient::request_async(
    const http::verb method, const std::string_view target, std::string body, const std::string_view content_type,
    CallbackType callback
) {
    auto request = Request(method, target.empty() ? "/" : target, 11);
    request.set(http::field::host, host_);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(http::field::accept, "*/*");
    request.keep_alive(true);

    if (!body.empty()) {
        request.set(http::field::content_type, content_type);
        request.body() = std::move(body);
        request.prepare_payload();
    }

    requests_.emplace(std::move(request), std::move(callback));

    if (!session_) {
        session_ = std::make_shared<Session>(io_context_, this, timeout_);
    }

    session_->send_requests();
}

void klk::HttpClient::cancel_outstanding_requests() {
    requests_ = {};
}

const std::string& klk::HttpClient::get_host() const {
    return host_;
}

const std::string& klk::HttpClient::get_service() const {
    return service_;
}

klk::HttpClient::Session::Session(
    boost::asio::io_context& io_context, HttpClient* owner, const std::chrono::milliseconds timeout
) :
    owner_(owner), timeout_(timeout), resolver_(io_context), stream_(io_context) {}

void klk::HttpClient::Session::send_requests() {
    KLK_ASSERT(owner_ != nullptr, "HttpClient::Session must have an owner");
    if (owner_->requests_.empty()) {
        return;
    }
    if (state_ == State::disconnected) {
        async_connect();
    } else if (state_ == State::connected) {
        async_send();
    }
}

void klk::HttpClient::Session::clear_owner() {
    owner_ = nullptr;
}

void klk::HttpClient::Session::async_connect() {
    KLK_ASSERT(owner_ != nullptr, "HttpClient::Session must have an owner");
    resolver_.async_resolve(
        owner_->host_, owner_->service_.empty() ? k_default_port : owner_->service_,
        boost::beast::bind_front_handler(&Session::on_resolve, shared_from_this())
    );
    state_ = State::resolving;
}

void klk::HttpClient::Session::async_send() {
    stream_.expires_after(timeout_);

    http::async_write(
        stream_, owner_->requests_.front().first,
        boost::beast::bind_front_handler(&Session::on_write, shared_from_this())
    );

    state_ = State::waiting_for_send;
}

void klk::HttpClient::Session::fail_front_request(const boost::beast::error_code& ec) {
    stream_.close();
    state_ = State::disconnected;

    // Move the callback out so that it survives a cancel_outstanding_requests from inside the callback.
    auto callback = std::move(owner_->requests_.front().second);
    owner_->requests_.pop();
    if (callback) {
        callback(ec);
    }

    // Give the remaining requests a fresh connection.
    if (owner_ != nullptr && !owner_->requests_.empty()) {
        async_connect();
    }
}

bool klk::HttpClient::Session::is_waiting_for_response() const {
    if (owner_ == nullptr) {
        return false;  // The client went away, nobody is waiting.
    }
    KLK_ASSERT_RETURN_WITH(!owner_->requests_.empty(), "No requests available", false);
    return true;
}

void klk::HttpClient::Session::on_resolve(
    const boost::beast::error_code& ec, const tcp::resolver::results_type& results
) {
    if (!is_waiting_for_response()) {
        return;
    }
    if (ec) {
        fail_front_request(ec);
        return;
    }

    stream_.expires_after(timeout_);
    stream_.async_connect(results, boost::beast::bind_front_handler(&Session::on_connect, shared_from_this()));
    state_ = State::connecting;
}

void klk::HttpClient::Session::
    on_connect(const boost::beast::error_code& ec, const tcp::resolver::results_type::endpoint_type&) {
    if (!is_waiting_for_response()) {
        return;
    }
    if (ec) {
        fail_front_request(ec);
        return;
    }

    state_ = State::connected;
    async_send();
}

void klk::HttpClient::Session::on_write(const boost::beast::error_code& ec, std::size_t) {
    if (!is_waiting_for_response()) {
        return;
    }
    if (ec) {
        fail_front_request(ec);
        return;
    }

    response_ = {};
    http::async_read(
        stream_, buffer_, response_, boost::beast::bind_front_handler(&Session::on_read, shared_from_this())
    );
    state_ = State::waiting_for_response;
}

void klk::HttpClient::Session::on_read(const boost::beast::error_code& ec, std::size_t) {
    if (!is_waiting_for_response()) {
        return;
    }
    if (ec) {
        fail_front_request(ec);
        return;
    }

    auto callback = std::move(owner_->requests_.front().second);
    owner_->requests_.pop();
    if (callback) {
        callback(response_);
    }

    if (owner_ == nullptr) {
        return;  // The client was destroyed from inside the callback.
    }

    if (!response_.keep_alive()) {
        close();
        if (!owner_->requests_.empty()) {
            async_connect();
        }
        return;
    }

    if (owner_->requests_.empty()) {
        state_ = State::connected;
        return;
    }

    async_send();
}

void klk::HttpClient::Session::close() {
    boost::beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::beast::errc::not_connected) {
        KLK_WARNING("Failed to shut down connection to {}: {}", owner_->host_, ec.message());
    }
    stream_.close();
    state_ = State::disconnected;
}
