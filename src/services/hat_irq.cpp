#include "hat_irq.hpp"
#include "hat_error.hpp"

HatIrq::HatIrq(HatRegisterFile& regs, const HatRegisterMap& map) : _regs(regs), _map(map)
{
    if(!_map.has_irq())
        throw HatError(HatErrorKind::InvalidAccess, std::string(_map.type().short_name) + " nao tem IRQ");
}

void HatIrq::check_mask(uint32_t mask) const
{
    if((mask & ~_map.di_channels().mask()) != 0)
        throw HatError(HatErrorKind::OutOfRange, "mascara de IRQ com canais inexistentes: " + std::to_string(mask));
}

uint32_t HatIrq::rising_edge_control()
{
    return _regs.read(_map.reg(HatField::IrqRisingEdgeControl));
}

void HatIrq::set_rising_edge_control(uint32_t mask)
{
    check_mask(mask);
    _regs.write(_map.reg(HatField::IrqRisingEdgeControl), mask);
}

uint32_t HatIrq::falling_edge_control()
{
    return _regs.read(_map.reg(HatField::IrqFallingEdgeControl));
}

void HatIrq::set_falling_edge_control(uint32_t mask)
{
    check_mask(mask);
    _regs.write(_map.reg(HatField::IrqFallingEdgeControl), mask);
}

uint32_t HatIrq::capture()
{
    return _regs.read(_map.reg(HatField::IrqCapture));
}

std::optional<HatIrqEvent> HatIrq::read_event()
{
    uint32_t raw = capture();
    if(raw == 0)
        return std::nullopt;
    return HatIrqEvent::decode(raw);
}

void HatIrq::clear_capture()
{
    _regs.write(_map.reg(HatField::IrqCapture), 0);
}

size_t HatIrq::drain(const EventCallback& callback)
{
    size_t count = 0;
    while(auto event = read_event())
    {
        if(callback)
            callback(*event);
        count++;
    }
    return count;
}
