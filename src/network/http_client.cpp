#include "mpu/network/http_client.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <istream>
#include <optional>
#include <sstream>

namespace mpu {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

Result<uint64_t> parse_number(const std::string& text, const std::string& what) {
    uint64_t value = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    auto [end, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || end != last || text.empty()) {
        return Err<uint64_t>(Error::network("Invalid " + what + ": '" + text + "'"));
    }
    return Ok(value);
}

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

} // namespace

// ──────────────────────────────────────────────────────────
// HttpEndpoint
// ──────────────────────────────────────────────────────────

Result<HttpEndpoint> HttpEndpoint::parse(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return Err<HttpEndpoint>(Error::config("Only http:// URLs are supported: " + url));
    }

    std::string rest = url.substr(scheme.size());
    HttpEndpoint endpoint;

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.base_path = rest.substr(slash);
        while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
            endpoint.base_path.pop_back();
        }
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        auto port = parse_number(authority.substr(colon + 1), "port");
        if (port.is_error() || port.value() == 0 || port.value() > 65535) {
            return Err<HttpEndpoint>(Error::config("Invalid port in URL: " + url));
        }
        endpoint.port = static_cast<uint16_t>(port.value());
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return Err<HttpEndpoint>(Error::config("Missing host in URL: " + url));
    }
    endpoint.host = authority;
    return Ok(std::move(endpoint));
}

std::string HttpEndpoint::to_string() const {
    return "http://" + host + ":" + std::to_string(port) + base_path;
}

// ──────────────────────────────────────────────────────────
// HttpClient
// ──────────────────────────────────────────────────────────

HttpClient::HttpClient(HttpEndpoint endpoint)
    : endpoint_(std::move(endpoint)) {
}

Result<HttpResponse> HttpClient::send(const ClientRequest& request, stream::ByteSink* body_sink) {
    boost::system::error_code ec;

    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(endpoint_.host, std::to_string(endpoint_.port), ec);
    if (ec) {
        return Err<HttpResponse>(Error::network("Failed to resolve " + endpoint_.host + ": " + ec.message()));
    }

    tcp::socket socket(io_context_);
    asio::connect(socket, endpoints, ec);
    if (ec) {
        return Err<HttpResponse>(Error::network("Failed to connect to " + endpoint_.to_string() + ": " + ec.message()));
    }

    auto written = write_request(socket, request);
    if (written.is_error()) {
        return Err<HttpResponse>(written.error());
    }

    auto response = read_response(socket, request.method == HttpMethod::HEAD, body_sink);

    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
    return response;
}

Result<void> HttpClient::write_request(tcp::socket& socket, const ClientRequest& request) {
    std::ostringstream head;
    head << HttpMethodUtils::to_string(request.method) << " "
         << endpoint_.base_path << request.target << " HTTP/1.1\r\n"
         << "Host: " << endpoint_.host << ":" << endpoint_.port << "\r\n"
         << "Connection: close\r\n";
    for (const auto& [name, value] : request.headers) {
        head << name << ": " << value << "\r\n";
    }
    if (request.body || request.method == HttpMethod::POST || request.method == HttpMethod::PUT) {
        head << "Content-Length: " << (request.body ? request.body_length : 0) << "\r\n";
    }
    head << "\r\n";

    boost::system::error_code ec;
    const std::string head_text = head.str();
    asio::write(socket, asio::buffer(head_text), ec);
    if (ec) {
        return Err<void>(Error::network("Failed to send request: " + ec.message()));
    }

    if (!request.body) {
        return Ok();
    }

    std::vector<uint8_t> chunk(stream::kDefaultBufferSize);
    uint64_t sent = 0;
    while (sent < request.body_length) {
        auto read = request.body->read(chunk.data(), chunk.size());
        if (read.is_error()) {
            return Err<void>(read.error());
        }
        if (read.value() == 0) {
            return Err<void>(Error::io("Request body ended after " + std::to_string(sent) + " of " +
                                       std::to_string(request.body_length) + " bytes"));
        }
        asio::write(socket, asio::buffer(chunk.data(), read.value()), ec);
        if (ec) {
            return Err<void>(Error::network("Connection lost while sending body: " + ec.message()));
        }
        sent += read.value();
        if (request.on_sent) {
            request.on_sent(sent);
        }
    }
    return Ok();
}

Result<HttpResponse> HttpClient::read_response(tcp::socket& socket, bool head_only, stream::ByteSink* body_sink) {
    boost::system::error_code ec;
    asio::streambuf buffer;

    asio::read_until(socket, buffer, "\r\n\r\n", ec);
    if (ec) {
        return Err<HttpResponse>(Error::network("Failed to read response head: " + ec.message()));
    }

    std::istream input(&buffer);
    std::string status_line;
    std::getline(input, status_line);
    status_line = trim(status_line);

    std::istringstream status_stream(status_line);
    std::string version;
    std::string code_text;
    status_stream >> version >> code_text;
    if (version.compare(0, 5, "HTTP/") != 0) {
        return Err<HttpResponse>(Error::network("Malformed status line: '" + status_line + "'"));
    }
    auto code = parse_number(code_text, "status code");
    if (code.is_error()) {
        return Err<HttpResponse>(code.error());
    }

    HttpResponse response;
    response.version = version == "HTTP/1.0" ? HttpVersion::HTTP_1_0 : HttpVersion::HTTP_1_1;
    response.status_code = static_cast<int>(code.value());
    std::getline(status_stream, response.reason_phrase);
    response.reason_phrase = trim(response.reason_phrase);

    std::string line;
    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            return Err<HttpResponse>(Error::network("Malformed header line: '" + line + "'"));
        }
        response.headers[line.substr(0, colon)] = trim(line.substr(colon + 1));
    }

    if (head_only || response.status_code == 204) {
        return Ok(std::move(response));
    }

    // Error bodies stay in the response for the caller to report
    if (response.status_code < 200 || response.status_code >= 300) {
        body_sink = nullptr;
    }

    std::optional<uint64_t> expected;
    std::string length_header = response.get_header("Content-Length");
    if (!length_header.empty()) {
        auto parsed = parse_number(length_header, "Content-Length");
        if (parsed.is_error()) {
            return Err<HttpResponse>(parsed.error());
        }
        expected = parsed.value();
    }

    uint64_t received = 0;
    auto deliver = [&](const uint8_t* data, size_t length) -> Result<void> {
        received += length;
        if (body_sink) {
            return body_sink->write(data, length);
        }
        response.body.insert(response.body.end(), data, data + length);
        return Ok();
    };

    // Bytes read past the head already sit in the streambuf
    if (buffer.size() > 0) {
        std::vector<uint8_t> leftover(buffer.size());
        input.read(reinterpret_cast<char*>(leftover.data()), static_cast<std::streamsize>(leftover.size()));
        size_t take = leftover.size();
        if (expected && take > *expected) {
            take = static_cast<size_t>(*expected);
        }
        auto delivered = deliver(leftover.data(), take);
        if (delivered.is_error()) {
            return Err<HttpResponse>(delivered.error());
        }
    }

    std::vector<uint8_t> chunk(stream::kDefaultBufferSize);
    while (!expected || received < *expected) {
        size_t want = chunk.size();
        if (expected && *expected - received < want) {
            want = static_cast<size_t>(*expected - received);
        }
        size_t n = socket.read_some(asio::buffer(chunk.data(), want), ec);
        if (ec == asio::error::eof && !expected) {
            break;
        }
        if (ec) {
            return Err<HttpResponse>(Error::network("Connection lost after " + std::to_string(received) +
                                                    " body bytes: " + ec.message()));
        }
        auto delivered = deliver(chunk.data(), n);
        if (delivered.is_error()) {
            return Err<HttpResponse>(delivered.error());
        }
    }

    if (body_sink) {
        auto closed = body_sink->close();
        if (closed.is_error()) {
            return Err<HttpResponse>(closed.error());
        }
    }

    spdlog::debug("{} {} -> {} ({} bytes)", endpoint_.host, response.status_code, response.reason_phrase, received);
    return Ok(std::move(response));
}

} // namespace network
} // namespace mpu
