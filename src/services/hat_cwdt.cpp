#include "hat_cwdt.hpp"
#include "hat_error.hpp"

HatCwdt::HatCwdt(HatRegisterFile& regs, const HatRegisterMap& map, LogSink log)
    : _regs(regs), _map(map), _log(log), _feeder([this]() { feed(); }, log)
{}

HatCwdt::~HatCwdt()
{
    _feeder.stop();
}

std::chrono::milliseconds HatCwdt::feed_interval(std::chrono::milliseconds period)
{
    if(period.count() <= 0)
        return std::chrono::milliseconds(0);

    auto half = period / 2;
    return half.count() > 0 ? half : std::chrono::milliseconds(1);
}

std::chrono::milliseconds HatCwdt::period()
{
    std::chrono::milliseconds value(_regs.read(_map.reg(HatField::CwdtPeriod)));

    std::lock_guard<std::mutex> lock(_period_mutex);
    _period = value;
    return value;
}

void HatCwdt::set_period(std::chrono::milliseconds period)
{
    if(period.count() < 0)
        throw HatError(HatErrorKind::OutOfRange, "periodo do CWDT nao pode ser negativo");

    if(period.count() > 0xFFFFFFFFLL)
        throw HatError(HatErrorKind::OutOfRange, "periodo do CWDT acima de 0xFFFFFFFF ms");

    _regs.write(_map.reg(HatField::CwdtPeriod), static_cast<uint32_t>(period.count()));
    {
        std::lock_guard<std::mutex> lock(_period_mutex);
        _period = period;
    }

    // 0 para a alimentacao; positivo so reinicia o intervalo se ja estiver rodando
    _feeder.set_interval(feed_interval(period));
}

bool HatCwdt::start_feeding()
{
    if(_feeder.running())
        return false;

    std::optional<std::chrono::milliseconds> cached;
    {
        std::lock_guard<std::mutex> lock(_period_mutex);
        cached = _period;
    }
    std::chrono::milliseconds known = cached ? *cached : period();

    if(known.count() == 0)
    {
        _log(LogLevel::Warning, "CWDT", "Periodo 0 (CWDT desabilitado), alimentacao nao iniciada");
        return false;
    }

    return _feeder.start(feed_interval(known));
}

bool HatCwdt::stop_feeding()
{
    return _feeder.stop();
}

void HatCwdt::feed()
{
    period();
}

void HatCwdt::apply(const CwdtPolicy& policy)
{
    switch(policy.mode)
    {
    case CwdtPolicy::Mode::Disable:
        stop_feeding();
        set_period(std::chrono::milliseconds(0));
        break;
    case CwdtPolicy::Mode::KeepBoardSetting:
        break;
    case CwdtPolicy::Mode::Feed:
        if(policy.period.count() <= 0)
            throw HatError(HatErrorKind::OutOfRange, "politica de alimentacao exige periodo > 0");
        set_period(policy.period);
        start_feeding();
        break;
    }
}

CwdtState HatCwdt::state() const
{
    std::optional<std::chrono::milliseconds> known;
    {
        std::lock_guard<std::mutex> lock(_period_mutex);
        known = _period;
    }
    return {known && known->count() > 0, known, _feeder.running(), _feeder.feed_count(), _feeder.failure_count(),
            _feeder.last_error()};
}
