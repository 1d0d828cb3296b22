#ifndef HAT_IRQ_EVENT_HPP
#define HAT_IRQ_EVENT_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

/* Registrador de captura (32 bits):
 *   bits 0..15  - canais com interrupcao pendente
 *   bits 16..31 - nivel de cada canal no momento da captura
 * Leitura 0 = fila vazia. */
struct HatIrqEvent
{
    static constexpr size_t CHANNEL_COUNT = 16;

    uint16_t pending{0};
    uint16_t states{0};

    static HatIrqEvent decode(uint32_t capture);

    uint32_t raw() const { return (static_cast<uint32_t>(states) << 16) | pending; }
    bool empty() const { return pending == 0 && states == 0; }

    bool triggered(size_t channel) const;
    bool state(size_t channel) const;

    // Canais pendentes, em ordem crescente
    std::vector<size_t> channels() const;
};

#endif
