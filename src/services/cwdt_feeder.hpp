#ifndef CWDT_FEEDER_HPP
#define CWDT_FEEDER_HPP

#include "hat_log.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Tarefa periodica que alimenta o Communication WatchDog Timer.
// Parado -> (start) -> Rodando -> (stop) -> Parado. Nunca inicia sozinha.
class CwdtFeeder
{
public:
    using FeedFunction = std::function<void()>;

    CwdtFeeder(FeedFunction feed, LogSink log);
    ~CwdtFeeder();

    CwdtFeeder(const CwdtFeeder&) = delete;
    CwdtFeeder& operator=(const CwdtFeeder&) = delete;

    // Alimenta imediatamente e depois a cada intervalo. false se ja rodando ou intervalo 0.
    bool start(std::chrono::milliseconds interval);

    // Sincrono: ao retornar a thread terminou e nenhuma escrita sera mais feita.
    bool stop();

    // Rodando: 0 para a alimentacao, positivo reinicia o intervalo agora.
    // Parado: apenas guarda o valor.
    void set_interval(std::chrono::milliseconds interval);

    bool running() const { return _running; }
    std::chrono::milliseconds interval() const;

    uint64_t feed_count() const { return _feed_count; }
    uint64_t failure_count() const { return _failure_count; }
    std::string last_error() const;

private:
    FeedFunction _feed;
    LogSink _log;

    mutable std::mutex _control_mutex;
    std::unique_ptr<boost::asio::io_context> _io;
    std::unique_ptr<boost::asio::steady_timer> _timer;
    std::thread _thread;
    std::atomic<bool> _running{false};
    std::chrono::milliseconds _interval{0};

    // Copia do intervalo usada so na thread do io_context
    std::chrono::milliseconds _tick{0};

    std::atomic<uint64_t> _feed_count{0};
    std::atomic<uint64_t> _failure_count{0};
    mutable std::mutex _error_mutex;
    std::string _last_error;

    bool stop_locked();
    void arm(std::chrono::milliseconds delay);
    void on_timer(const boost::system::error_code& error);
};

#endif
