#include "hat_digital.hpp"
#include "hat_error.hpp"
#include <cstdio>

static std::string hex_word(uint32_t value)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%X", value);
    return buf;
}

/* ================= Entradas ================= */

HatDigitalInputs::HatDigitalInputs(HatRegisterFile& regs, const HatRegisterMap& map) : _regs(regs), _map(map)
{
    if(!_map.has_di())
        throw HatError(HatErrorKind::InvalidAccess, std::string(_map.type().short_name) + " nao tem entradas digitais");
}

uint32_t HatDigitalInputs::value()
{
    return _regs.read(_map.reg(HatField::DiValue)) & channels().mask();
}

bool HatDigitalInputs::channel(size_t index)
{
    return _regs.read(_map.di_channel(index)) != 0;
}

bool HatDigitalInputs::channel(const std::string& label)
{
    return channel(channels().index_of(label));
}

uint32_t HatDigitalInputs::counter(HatEdge edge, size_t index)
{
    return _regs.read(_map.counter(edge, index));
}

uint32_t HatDigitalInputs::counter(HatEdge edge, const std::string& label)
{
    return counter(edge, channels().index_of(label));
}

void HatDigitalInputs::reset_counter(HatEdge edge, size_t index, uint32_t value)
{
    HatRegister reg = _map.counter_reset(edge, index);
    if(value != 0)
        throw HatError(HatErrorKind::OutOfRange, "contador so aceita '0' (reset)");

    _regs.write(reg, 0);
}

void HatDigitalInputs::reset_counter(HatEdge edge, const std::string& label, uint32_t value)
{
    reset_counter(edge, channels().index_of(label), value);
}

void HatDigitalInputs::reset_counters()
{
    _regs.write(_map.reg(HatField::DiResetCounters), 0);
}

/* ================= Saidas ================= */

HatDigitalOutputs::HatDigitalOutputs(HatRegisterFile& regs, const HatRegisterMap& map) : _regs(regs), _map(map)
{
    if(!_map.has_dq())
        throw HatError(HatErrorKind::InvalidAccess, std::string(_map.type().short_name) + " nao tem saidas digitais");
}

void HatDigitalOutputs::check_value(uint32_t value) const
{
    uint32_t mask = channels().mask();
    if((value & ~mask) != 0)
    {
        throw HatError(HatErrorKind::OutOfRange,
                       "'" + hex_word(value) + "' nao e um valor valido, faixa [0x0 .. " + hex_word(mask) + "]");
    }
}

uint32_t HatDigitalOutputs::value()
{
    return _regs.read(_map.reg(HatField::DqValue));
}

void HatDigitalOutputs::set_value(uint32_t value)
{
    check_value(value);
    _regs.write(_map.reg(HatField::DqValue), value);
}

bool HatDigitalOutputs::channel(size_t index)
{
    return _regs.read(_map.dq_channel(index)) != 0;
}

bool HatDigitalOutputs::channel(const std::string& label)
{
    return channel(channels().index_of(label));
}

void HatDigitalOutputs::set_channel(size_t index, bool state)
{
    _regs.write(_map.dq_channel(index), state ? 1 : 0);
}

void HatDigitalOutputs::set_channel(const std::string& label, bool state)
{
    set_channel(channels().index_of(label), state);
}

uint32_t HatDigitalOutputs::power_on_value()
{
    return _regs.read(_map.reg(HatField::DqPowerOnValue));
}

void HatDigitalOutputs::set_power_on_value(uint32_t value)
{
    check_value(value);
    _regs.write(_map.reg(HatField::DqPowerOnValue), value);
}

uint32_t HatDigitalOutputs::safety_value()
{
    return _regs.read(_map.reg(HatField::DqSafetyValue));
}

void HatDigitalOutputs::set_safety_value(uint32_t value)
{
    check_value(value);
    _regs.write(_map.reg(HatField::DqSafetyValue), value);
}
