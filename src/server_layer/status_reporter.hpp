#ifndef STATUS_REPORTER_HPP
#define STATUS_REPORTER_HPP

#include <boost/asio.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <cstdio>
#include <functional>
#include <string>
#include <vector>

#include "hat_board.hpp"
#include "hat_error.hpp"
#include "hat_irq_event.hpp"
#include "hat_log.hpp"

// ============================================================
// Publica o estado das placas como uma linha JSON por placa
// ============================================================

using PayloadCallback = std::function<void(const std::string&)>;

class StatusReporter
{
public:
    StatusReporter(boost::asio::io_context& io, std::vector<HatBoard*> boards, std::chrono::seconds interval,
                   PayloadCallback publish, LogSink log)
        : _timer(io), _boards(std::move(boards)), _interval(interval), _publish(std::move(publish)),
          _log(std::move(log))
    {}

    void start()
    {
        _timer.expires_after(std::chrono::seconds(0));
        _timer.async_wait([this](const boost::system::error_code& ec) { tick(ec); });
    }

    void stop() { _timer.cancel(); }

    static std::string address_text(const HatBoard& board)
    {
        char adr[8];
        std::snprintf(adr, sizeof(adr), "0x%02X", board.address());
        return adr;
    }

    static boost::json::object status_json(HatBoard& board)
    {
        boost::json::object json;
        json["board"] = board.name();
        json["address"] = address_text(board);
        json["firmware"] = board.firmware_version();

        // Estado do CWDT vem da memoria: nao gera transacao
        CwdtState cwdt = board.cwdt().state();
        boost::json::object cwdt_json;
        // Periodo ausente ate a primeira leitura/escrita
        if(cwdt.period)
            cwdt_json["period_ms"] = cwdt.period->count();
        cwdt_json["feeding"] = cwdt.feeding;
        cwdt_json["feeds"] = cwdt.feed_count;
        cwdt_json["failures"] = cwdt.failure_count;
        if(!cwdt.last_error.empty())
            cwdt_json["last_error"] = cwdt.last_error;
        json["cwdt"] = cwdt_json;

        try
        {
            HatStatus status = board.status();
            boost::json::object status_json;
            status_json["raw"] = status.raw;
            status_json["cwdt_timeout"] = status.cwdt_timeout;
            status_json["comm_error"] = status.comm_error;
            status_json["irq_overflow"] = status.irq_overflow;
            json["status"] = status_json;

            if(board.has_di())
                json["di"] = board.di().value();
            if(board.has_dq())
                json["dq"] = board.dq().value();
        }
        catch(const HatError& e)
        {
            json["error"] = e.what();
            json["error_kind"] = to_string(e.kind());
        }
        return json;
    }

    static boost::json::object irq_event_json(const HatBoard& board, const HatIrqEvent& event)
    {
        boost::json::object json;
        json["board"] = board.name();
        json["address"] = address_text(board);
        json["capture"] = event.raw();

        boost::json::array channels;
        for(size_t ch : event.channels())
        {
            boost::json::object channel;
            channel["index"] = ch;
            if(ch < board.type().di.count())
                channel["label"] = board.type().di.label_of(ch);
            channel["state"] = event.state(ch);
            channels.push_back(channel);
        }
        json["channels"] = channels;
        return json;
    }

    void publish_irq_event(const HatBoard& board, const HatIrqEvent& event)
    {
        _publish(boost::json::serialize(irq_event_json(board, event)));
    }

private:
    boost::asio::steady_timer _timer;
    std::vector<HatBoard*> _boards;
    std::chrono::seconds _interval;
    PayloadCallback _publish;
    LogSink _log;

    void tick(const boost::system::error_code& error)
    {
        // Timer cancelado (shutdown)
        if(error)
            return;

        for(HatBoard* board : _boards)
        {
            boost::json::object json = status_json(*board);
            if(json.contains("error"))
                _log(LogLevel::Warning, "STATUS", board->to_string() + ": " + std::string(json["error"].as_string().c_str()));
            _publish(boost::json::serialize(json));
        }

        _timer.expires_after(_interval);
        _timer.async_wait([this](const boost::system::error_code& ec) { tick(ec); });
    }
};

#endif
