#ifndef HAL_GPIO_HPP
#define HAL_GPIO_HPP

#include "irq_line.hpp"
#include <gpiod.h>
#include <cstddef>
#include <cstdint>
#include <string>

// Linha GPIO de entrada via libgpiod v2 (character device)
class HalGpio : public IrqLine
{
public:
    enum class Edge
    {
        None,
        Rising,
        Falling,
        Both
    };

    enum class Bias
    {
        AsIs,
        PullUp,
        PullDown
    };

    HalGpio(unsigned int pin, Edge edge, Bias bias, bool active_low, const char* chip_name);
    ~HalGpio() override;

    HalGpio(const HalGpio&) = delete;
    HalGpio& operator=(const HalGpio&) = delete;

    unsigned int pin() const override { return _pin; }

    bool get() const;

    // timeout_ns < 0 espera indefinidamente; Edge::None no timeout.
    // Linha sem deteccao de borda -> InvalidAccess; falha do chip -> TransferError
    Edge wait_for_edge(int64_t timeout_ns);

    bool active() const override { return get(); }
    bool wait_irq(int64_t timeout_ns) override { return wait_for_edge(timeout_ns) != Edge::None; }

private:
    unsigned int _pin;
    std::string _chip_path;

    struct gpiod_chip* _chip{nullptr};
    struct gpiod_line_request* _req{nullptr};
    struct gpiod_edge_event_buffer* _buffer{nullptr};
};

#endif
