#include "cwdt_feeder.hpp"
#include <exception>

CwdtFeeder::CwdtFeeder(FeedFunction feed, LogSink log) : _feed(std::move(feed)), _log(std::move(log)) {}

CwdtFeeder::~CwdtFeeder()
{
    stop();
}

bool CwdtFeeder::start(std::chrono::milliseconds interval)
{
    std::lock_guard<std::mutex> lock(_control_mutex);

    if(_running || interval.count() <= 0)
        return false;

    _interval = interval;
    _tick = interval;
    _io = std::make_unique<boost::asio::io_context>();
    _timer = std::make_unique<boost::asio::steady_timer>(*_io);

    // Primeira alimentacao sem espera
    arm(std::chrono::milliseconds(0));

    _running = true;
    boost::asio::io_context* io = _io.get();
    _thread = std::thread([io]() { io->run(); });

    _log(LogLevel::Info, "CWDT", "Alimentacao iniciada (intervalo " + std::to_string(interval.count()) + " ms)");
    return true;
}

bool CwdtFeeder::stop()
{
    std::lock_guard<std::mutex> lock(_control_mutex);
    return stop_locked();
}

bool CwdtFeeder::stop_locked()
{
    if(!_running)
        return false;

    _io->stop();
    if(_thread.joinable())
    {
        _thread.join();
    }

    // Handlers pendentes sao destruidos sem executar
    _timer.reset();
    _io.reset();
    _running = false;

    _log(LogLevel::Info, "CWDT", "Alimentacao parada");
    return true;
}

void CwdtFeeder::set_interval(std::chrono::milliseconds interval)
{
    std::lock_guard<std::mutex> lock(_control_mutex);

    if(interval.count() < 0)
        interval = std::chrono::milliseconds(0);

    _interval = interval;
    if(!_running)
        return;

    if(interval.count() == 0)
    {
        stop_locked();
        return;
    }

    boost::asio::post(*_io, [this, interval]() {
        _tick = interval;
        arm(interval);
    });
}

std::chrono::milliseconds CwdtFeeder::interval() const
{
    std::lock_guard<std::mutex> lock(_control_mutex);
    return _interval;
}

std::string CwdtFeeder::last_error() const
{
    std::lock_guard<std::mutex> lock(_error_mutex);
    return _last_error;
}

void CwdtFeeder::arm(std::chrono::milliseconds delay)
{
    // expires_after cancela a espera anterior: sempre ha uma unica cadeia de timers
    _timer->expires_after(delay);
    _timer->async_wait([this](const boost::system::error_code& ec) { on_timer(ec); });
}

void CwdtFeeder::on_timer(const boost::system::error_code& error)
{
    // Cancelado (novo intervalo ou parada)
    if(error)
        return;

    try
    {
        _feed();
        _feed_count++;
    }
    catch(const std::exception& e)
    {
        // Falha de comunicacao: conta, registra e tenta de novo no proximo ciclo
        _failure_count++;
        {
            std::lock_guard<std::mutex> lock(_error_mutex);
            _last_error = e.what();
        }
        _log(LogLevel::Warning, "CWDT", std::string("Falha ao alimentar: ") + e.what());
    }

    arm(_tick);
}
