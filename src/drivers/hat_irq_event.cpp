#include "hat_irq_event.hpp"

HatIrqEvent HatIrqEvent::decode(uint32_t capture)
{
    HatIrqEvent event;
    event.pending = static_cast<uint16_t>(capture & 0xFFFF);
    event.states = static_cast<uint16_t>((capture >> 16) & 0xFFFF);
    return event;
}

bool HatIrqEvent::triggered(size_t channel) const
{
    if(channel >= CHANNEL_COUNT)
        return false;
    return ((pending >> channel) & 0x01) != 0;
}

bool HatIrqEvent::state(size_t channel) const
{
    if(channel >= CHANNEL_COUNT)
        return false;
    return ((states >> channel) & 0x01) != 0;
}

std::vector<size_t> HatIrqEvent::channels() const
{
    std::vector<size_t> result;
    for(size_t ch = 0; ch < CHANNEL_COUNT; ch++)
    {
        if(triggered(ch))
            result.push_back(ch);
    }
    return result;
}
