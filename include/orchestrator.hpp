
#pragma once
#include <asio.hpp>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "camera_client.hpp"
#include "config.hpp"
#include "framing.hpp"
#include "session.hpp"
#include "transport.hpp"

namespace shotlink {

// Owns every TransferSession. Feeds camera reads into the session controller
// of the connected client, one streaming session at a time, in FIFO order.
class Orchestrator : public std::enable_shared_from_this<Orchestrator> {
public:
    Orchestrator(asio::io_context& io, const BridgeConfig& cfg);

    // Takes an attached camera and subscribes to its events.
    void set_camera(std::shared_ptr<CameraClient> camera);
    // Accept handler target for Transport::open.
    void on_connection(std::error_code ec, ConnectionPtr conn);
    void shutdown();

    bool client_connected() const { return link_ != nullptr; }
    const std::string& client_id() const;
    std::optional<SessionId> active_session() const { return active_; }
    size_t queued() const { return queue_.size(); }
    // Live session, or the most recent history entry with that id.
    const TransferSession* find(const SessionId& id) const;
    const TransferSession* find_by_object(uint32_t object_id) const;
    std::vector<TransferSession> sessions() const;
    const std::deque<TransferSession>& history() const { return history_; }
    size_t held_notices(const std::string& client_id) const;

private:
    struct Link {
        ConnectionPtr conn;
        std::shared_ptr<FramingLayer> framing;
        std::shared_ptr<SessionController> ctl;
        std::string client_id;
        bool hello{false};
        uint64_t id{0};
    };

    // camera events
    void on_camera_event(const CameraEvent& ev);
    void on_object_added(uint32_t handle);
    void on_device_gone();

    // client link
    void on_link_error(uint64_t link_id, std::error_code ec);
    void on_control(const ControlMessage& m);
    void on_hello(const std::string& client);
    void on_resume(const SessionId& id, uint64_t offset);
    void on_delete(uint32_t object_id);
    void on_pull(uint32_t object_id);
    void on_cancel(const SessionId& id);
    void on_list();
    void send(const ControlMessage& m);

    // sessions
    TransferSession& create(uint32_t object_id, const std::string& client);
    void promote();
    void pump();
    void on_read(uint64_t offset, CameraError err, std::vector<uint8_t>&& data);
    void camera_failure(CameraError err);
    void interrupt_active(AbortReason reason, uint16_t code);
    void abort(const SessionId& id, AbortReason reason, uint16_t code = 0);
    void finish(const SessionId& id, SessionState state, AbortReason reason, uint16_t code);
    void start_ttl(const SessionId& id);
    void stop_ttl(const SessionId& id);
    void notify(const TransferSession& s);
    ControlMessage status_message(const TransferSession& s) const;
    TransferSession* live(const SessionId& id);
    TransferSession* live_for_object(uint32_t object_id);
    void stop_reading();

    asio::io_context& io_;
    BridgeConfig cfg_;
    std::shared_ptr<CameraClient> camera_;

    std::unique_ptr<Link> link_;
    uint64_t next_link_id_{1};

    std::map<SessionId, TransferSession> sessions_;
    std::deque<SessionId> queue_;
    std::optional<SessionId> active_;
    std::deque<TransferSession> history_;
    std::map<SessionId, std::unique_ptr<asio::steady_timer>> ttl_timers_;
    std::map<std::string, std::vector<ControlMessage>> held_;

    bool reading_{false};
    uint64_t read_gen_{0};
};

} // namespace shotlink
