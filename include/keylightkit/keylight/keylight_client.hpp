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

#include "keylight_status.hpp"

#include "keylightkit/core/expected.hpp"
#include "keylightkit/core/net/http/http_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/url/url.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace klk::keylight {

/**
 * Talks to the HTTP API of a single light.
 */
class KeyLightClient {
  public:
    using GetStatusCallback = std::function<void(tl::expected<DeviceStatus, std::string> status)>;
    using SetStatusCallback = std::function<void(tl::expected<void, std::string> result)>;

    /**
     * Builds the base url of a device from a host and a port: "http://{host}:{port}/".
     * @param host A hostname, an IPv4 address or an IPv6 address (without brackets).
     * @param port The port.
     * @return The url, or an error message if the host and port don't form a valid url.
     */
    [[nodiscard]] static tl::expected<boost::urls::url, std::string>
    make_base_url(std::string_view host, std::string_view port);

    /**
     * Joins the base url of a device with the path of the lights resource.
     * @param base_url The base url of the device (i.e. http://192.168.0.92:9123/).
     * @return The url of the lights resource (i.e. http://192.168.0.92:9123/elgato/lights), or an error message.
     */
    [[nodiscard]] static tl::expected<boost::urls::url, std::string> make_lights_url(const boost::urls::url& base_url);

    /**
     * Constructs a client for the device with given base url.
     * @param io_context The io_context to run the requests on.
     * @param base_url The base url of the device, as found by discovery.
     * @throws klk::Exception if the lights url can't be derived from the base url.
     */
    KeyLightClient(boost::asio::io_context& io_context, const boost::urls::url& base_url);

    /**
     * @return The url of the lights resource.
     */
    [[nodiscard]] const boost::urls::url& get_lights_url() const;

    /**
     * Gets the status of the lights (GET elgato/lights).
     * @param callback Called on the io_context with the status or an error message.
     */
    void get_status_async(GetStatusCallback callback);

    /**
     * Sets the status of the lights (PUT elgato/lights).
     * @param status The status to set.
     * @param callback Called on the io_context when the device answered.
     */
    void set_status_async(const DeviceStatus& status, SetStatusCallback callback);

    /**
     * Gets the status, updates one light and puts the updated status back.
     * @param index The index of the light to update.
     * @param update Called with the light to update.
     * @param callback Called on the io_context with the updated status or an error message.
     */
    void update_status_async(size_t index, std::function<void(LightStatus&)> update, GetStatusCallback callback);

  private:
    boost::urls::url lights_url_;
    HttpClient http_client_;
};

/**
 * Blocking version of KeyLightClient::get_status_async.
 * @param base_url The base url of the device.
 * @return The status, or an error message.
 */
[[nodiscard]] tl::expected<DeviceStatus, std::string> get_status(const boost::urls::url& base_url);

/**
 * Blocking version of KeyLightClient::set_status_async.
 * @param base_url The base url of the device.
 * @param status The status to set.
 * @return An error message if the request failed.
 */
tl::expected<void, std::string> set_status(const boost::urls::url& base_url, const DeviceStatus& status);

/**
 * Blocking version of KeyLightClient::update_status_async.
 * @param base_url The base url of the device.
 * @param index The index of the light to update.
 * @param update Called with the light to update.
 * @return The updated status, or an error message.
 */
tl::expected<DeviceStatus, std::string>
update_status(const boost::urls::url& base_url, size_t index, std::function<void(LightStatus&)> update);

}  // namespace klk::keylight
