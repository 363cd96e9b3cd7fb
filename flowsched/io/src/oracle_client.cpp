#include <flowsched/io/oracle_client.hpp>

#include <flowsched/algo/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <stdexcept>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace flowsched::io {

namespace {

using algo::OracleUnavailableError;

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

void write_state(rapidjson::Writer<rapidjson::StringBuffer>& writer, const std::vector<int64_t>& state) {
    writer.Key("state");
    writer.StartArray();
    for (int64_t value : state) {
        writer.Int64(value);
    }
    writer.EndArray();
}

rapidjson::Document parse_reply(const std::string& line, std::string_view op) {
    rapidjson::Document reply;
    reply.Parse(line.data(), line.size());
    if (reply.HasParseError()) {
        throw OracleUnavailableError("malformed reply to " + std::string(op) + ": " +
                                     rapidjson::GetParseError_En(reply.GetParseError()));
    }
    if (!reply.IsObject()) {
        throw OracleUnavailableError("reply to " + std::string(op) + " is not an object");
    }
    if (reply.HasMember("error")) {
        const auto& error = reply["error"];
        std::string message = error.IsString() ? error.GetString() : "unspecified";
        throw OracleUnavailableError("oracle rejected " + std::string(op) + ": " + message);
    }
    return reply;
}

} // anonymous namespace

// =============================================================================
// Endpoint
// =============================================================================

OracleEndpoint parse_endpoint(std::string_view text) {
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        throw std::invalid_argument("expected HOST:PORT, got '" + std::string(text) + "'");
    }

    auto port_text = text.substr(colon + 1);
    unsigned port = 0;
    auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || end != port_text.data() + port_text.size() || port == 0 || port > 65535) {
        throw std::invalid_argument("invalid port '" + std::string(port_text) + "'");
    }
    return OracleEndpoint{std::string(text.substr(0, colon)), static_cast<uint16_t>(port)};
}

// =============================================================================
// TcpChannel
// =============================================================================

TcpChannel::TcpChannel(const OracleEndpoint& endpoint, std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    std::string port = std::to_string(endpoint.port);
    int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        throw OracleUnavailableError("cannot resolve " + endpoint.host + ": " + ::gai_strerror(rc));
    }

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    std::string last_error = "no address";
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno_message("socket");
            continue;
        }
        // SO_SNDTIMEO also bounds connect() on Linux
        if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
            ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
            last_error = errno_message("setsockopt");
            ::close(fd);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = fd;
            break;
        }
        last_error = errno_message("connect");
        ::close(fd);
    }
    ::freeaddrinfo(results);

    if (fd_ < 0) {
        throw OracleUnavailableError("cannot reach oracle at " + endpoint.host + ":" + port + " (" +
                                     last_error + ")");
    }
}

TcpChannel::~TcpChannel() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void TcpChannel::send_line(std::string_view line) {
    std::string payload(line);
    payload.push_back('\n');

    std::size_t sent = 0;
    while (sent < payload.size()) {
        ssize_t n = ::send(fd_, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw OracleUnavailableError(errno_message("send to oracle"));
        }
        sent += static_cast<std::size_t>(n);
    }
}

std::string TcpChannel::receive_line() {
    while (true) {
        auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }

        char chunk[4096];
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n == 0) {
            throw OracleUnavailableError("oracle closed the connection");
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw OracleUnavailableError("timed out waiting for the oracle");
            }
            throw OracleUnavailableError(errno_message("receive from oracle"));
        }
        buffer_.append(chunk, static_cast<std::size_t>(n));
    }
}

// =============================================================================
// JsonLineOracle
// =============================================================================

JsonLineOracle::JsonLineOracle(OracleChannel& channel)
    : channel_(channel) {}

int32_t JsonLineOracle::decide(const algo::DecisionContext& context,
                               const std::vector<int64_t>& state) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("op");
    writer.String("decide");
    writer.Key("time");
    writer.Double(core::time_to_seconds(context.time));
    writer.Key("ready");
    writer.Uint64(context.ready_count);
    writer.Key("idle");
    writer.Uint64(context.idle_resources);
    write_state(writer, state);
    writer.EndObject();

    channel_.send_line({buffer.GetString(), buffer.GetSize()});
    auto reply = parse_reply(channel_.receive_line(), "decide");
    if (!reply.HasMember("action") || !reply["action"].IsInt()) {
        throw OracleUnavailableError("reply to decide lacks an integer 'action'");
    }
    return reply["action"].GetInt();
}

void JsonLineOracle::report_reward(core::TaskId task_id, double reward) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("op");
    writer.String("reward");
    writer.Key("task");
    writer.Uint64(task_id);
    writer.Key("reward");
    writer.Double(reward);
    writer.EndObject();

    channel_.send_line({buffer.GetString(), buffer.GetSize()});
    expect_ok("reward");
}

void JsonLineOracle::retrain(core::TaskId previous_task_id, const std::vector<int64_t>& state) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("op");
    writer.String("retrain");
    writer.Key("task");
    writer.Uint64(previous_task_id);
    write_state(writer, state);
    writer.EndObject();

    channel_.send_line({buffer.GetString(), buffer.GetSize()});
    expect_ok("retrain");
}

void JsonLineOracle::expect_ok(std::string_view op) {
    auto reply = parse_reply(channel_.receive_line(), op);
    if (!reply.HasMember("ok") || !reply["ok"].IsBool() || !reply["ok"].GetBool()) {
        throw OracleUnavailableError("reply to " + std::string(op) + " is not {\"ok\":true}");
    }
}

} // namespace flowsched::io
