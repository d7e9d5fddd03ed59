/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "keylightkit/keylight/keylight_client.hpp"

#include "keylightkit/core/exception.hpp"
#include "keylightkit/core/json.hpp"
#include "keylightkit/core/log.hpp"

#include <boost/url/parse.hpp>
#include <fmt/format.h>

#include <optional>

namespace {

tl::expected<void, std::string> check_response(const boost::system::result<klk::HttpClient::Response>& response) {
    if (response.has_error()) {
        return tl::unexpected(fmt::format("Request failed: {}", response.error().message()));
    }
    if (response->result() != klk::http::status::ok) {
        return tl::unexpected(fmt::format("Unexpected response: {}", response->result_int()));
    }
    return {};
}

std::string_view get_target(const boost::urls::url& url) {
    const auto target = url.encoded_target();
    return {target.data(), target.size()};
}

}  // namespace

tl::expected<boost::urls::url, std::string>
klk::keylight::KeyLightClient::make_base_url(const std::string_view host, const std::string_view port) {
    const auto text = host.find(':') != std::string_view::npos ? fmt::format("http://[{}]:{}/", host, port)
                                                                : fmt::format("http://{}:{}/", host, port);
    auto parsed = boost::urls::parse_absolute_uri(text);
    if (!parsed) {
        return tl::unexpected(fmt::format("Invalid url {}: {}", text, parsed.error().message()));
    }
    return boost::urls::url(*parsed);
}

tl::expected<boost::urls::url, std::string>
klk::keylight::KeyLightClient::make_lights_url(const boost::urls::url& base_url) {
    const auto ref = boost::urls::parse_relative_ref(k_lights_path);
    if (!ref) {
        return tl::unexpected(fmt::format("Invalid path {}: {}", k_lights_path, ref.error().message()));
    }

    boost::urls::url lights_url;
    const auto result = boost::urls::resolve(base_url, *ref, lights_url);
    if (!result) {
        return tl::unexpected(fmt::format(
            "Failed to join {} with {}: {}", std::string_view(base_url.buffer()), k_lights_path,
            result.error().message()
        ));
    }
    return lights_url;
}

klk::keylight::KeyLightClient::KeyLightClient(boost::asio::io_context& io_context, const boost::urls::url& base_url) :
    lights_url_([&base_url] {
        auto url = make_lights_url(base_url);
        if (!url) {
            KLK_THROW_EXCEPTION("{}", url.error());
        }
        return std::move(*url);
    }()),
    http_client_(io_context, lights_url_) {}

const boost::urls::url& klk::keylight::KeyLightClient::get_lights_url() const {
    return lights_url_;
}

void klk::keylight::KeyLightClient::get_status_async(GetStatusCallback callback) {
    http_client_.get_async(
        get_target(lights_url_),
        [cb = std::move(callback)](const boost::system::result<HttpClient::Response>& response) {
            if (const auto checked = check_response(response); !checked) {
                cb(tl::unexpected(checked.error()));
                return;
            }

            auto status = parse_json<DeviceStatus>(response->body());
            if (status.has_error()) {
                cb(tl::unexpected(fmt::format("Invalid status: {}", status.error().message())));
                return;
            }

            KLK_TRACE("Status: {}", response->body());
            cb(std::move(*status));
        }
    );
}

void klk::keylight::KeyLightClient::set_status_async(const DeviceStatus& status, SetStatusCallback callback) {
    http_client_.put_async(
        get_target(lights_url_), status.to_json(),
        [cb = std::move(callback)](const boost::system::result<HttpClient::Response>& response) {
            cb(check_response(response));
        }
    );
}

void klk::keylight::KeyLightClient::update_status_async(
    const size_t index, std::function<void(LightStatus&)> update, GetStatusCallback callback
) {
    get_status_async([this, index, update = std::move(update),
                      cb = std::move(callback)](tl::expected<DeviceStatus, std::string> status) mutable {
        if (!status) {
            cb(std::move(status));
            return;
        }

        if (auto result = status->set(index, update); !result) {
            cb(tl::unexpected(result.error()));
            return;
        }

        auto updated = std::move(*status);
        set_status_async(updated, [updated, cb = std::move(cb)](const tl::expected<void, std::string>& result) {
            if (!result) {
                cb(tl::unexpected(result.error()));
                return;
            }
            cb(updated);
        });
    });
}

tl::expected<klk::keylight::DeviceStatus, std::string> klk::keylight::get_status(const boost::urls::url& base_url) {
    boost::asio::io_context io_context;
    KeyLightClient client(io_context, base_url);

    std::optional<tl::expected<DeviceStatus, std::string>> result;
    client.get_status_async([&result](tl::expected<DeviceStatus, std::string> status) {
        result = std::move(status);
    });
    io_context.run();

    if (!result) {
        return tl::unexpected(std::string("Request did not complete"));
    }
    return std::move(*result);
}

tl::expected<void, std::string>
klk::keylight::set_status(const boost::urls::url& base_url, const DeviceStatus& status) {
    boost::asio::io_context io_context;
    KeyLightClient client(io_context, base_url);

    std::optional<tl::expected<void, std::string>> result;
    client.set_status_async(status, [&result](tl::expected<void, std::string> r) {
        result = std::move(r);
    });
    io_context.run();

    if (!result) {
        return tl::unexpected(std::string("Request did not complete"));
    }
    return *result;
}

tl::expected<klk::keylight::DeviceStatus, std::string> klk::keylight::update_status(
    const boost::urls::url& base_url, const size_t index, std::function<void(LightStatus&)> update
) {
    boost::asio::io_context io_context;
    KeyLightClient client(io_context, base_url);

    std::optional<tl::expected<DeviceStatus, std::string>> result;
    client.update_status_async(index, std::move(update), [&result](tl::expected<DeviceStatus, std::string> status) {
        result = std::move(status);
    });
    io_context.run();

    if (!result) {
        return tl::unexpected(std::string("Request did not complete"));
    }
    return std::move(*result);
}
