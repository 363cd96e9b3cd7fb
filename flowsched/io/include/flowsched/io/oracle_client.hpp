#pragma once

/// @file oracle_client.hpp
/// @brief Line-delimited JSON protocol to an external decision oracle.
/// @ingroup io_oracle

#include <flowsched/algo/oracle.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace flowsched::io {

/// @brief Bidirectional line transport to the oracle.
///
/// Lines carry no trailing newline on either side of the interface.
/// Implementations report every failure (closed peer, timeout, I/O error)
/// as algo::OracleUnavailableError.
///
/// @ingroup io_oracle
/// @see TcpChannel, JsonLineOracle
class OracleChannel {
public:
    virtual ~OracleChannel() = default;

    /// @brief Send one line.
    virtual void send_line(std::string_view line) = 0;

    /// @brief Block until one full line is received.
    virtual std::string receive_line() = 0;

protected:
    OracleChannel() = default;
    OracleChannel(const OracleChannel&) = default;
    OracleChannel& operator=(const OracleChannel&) = default;
};

/// @brief Host and port of a remote oracle.
/// @ingroup io_oracle
struct OracleEndpoint {
    std::string host;
    uint16_t port;
};

/// @brief Parse `HOST:PORT`.
/// @throws std::invalid_argument if the host is empty or the port is not in 1..65535.
[[nodiscard]] OracleEndpoint parse_endpoint(std::string_view text);

/// @brief Blocking TCP client channel.
///
/// Send and receive operations time out after the configured delay, which
/// also bounds connection establishment.
///
/// @ingroup io_oracle
class TcpChannel : public OracleChannel {
public:
    /// @brief Connect to @p endpoint.
    /// @throws algo::OracleUnavailableError if the host cannot be resolved or reached.
    TcpChannel(const OracleEndpoint& endpoint, std::chrono::milliseconds timeout);
    ~TcpChannel() override;

    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;
    TcpChannel(TcpChannel&&) = delete;
    TcpChannel& operator=(TcpChannel&&) = delete;

    void send_line(std::string_view line) override;
    std::string receive_line() override;

private:
    int fd_{-1};
    std::string buffer_;
};

/// @brief DecisionOracle speaking one JSON object per line.
///
/// Requests and expected replies:
/// @code
/// {"op":"decide","time":t,"ready":n,"idle":k,"state":[...]}  ->  {"action":a}
/// {"op":"reward","task":id,"reward":r}                       ->  {"ok":true}
/// {"op":"retrain","task":id,"state":[...]}                   ->  {"ok":true}
/// @endcode
/// A reply that is not valid JSON, lacks the expected field, or carries
/// an `"error"` member raises algo::OracleUnavailableError.
///
/// @ingroup io_oracle
/// @see algo::DecisionOracle
class JsonLineOracle : public algo::DecisionOracle {
public:
    /// @param channel  Transport (must outlive this oracle).
    explicit JsonLineOracle(OracleChannel& channel);

    int32_t decide(const algo::DecisionContext& context, const std::vector<int64_t>& state) override;
    void report_reward(core::TaskId task_id, double reward) override;
    void retrain(core::TaskId previous_task_id, const std::vector<int64_t>& state) override;

private:
    void expect_ok(std::string_view op);

    OracleChannel& channel_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace flowsched::io
