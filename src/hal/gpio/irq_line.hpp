#ifndef IRQ_LINE_HPP
#define IRQ_LINE_HPP

#include <cstdint>

// Linha de interrupcao vista pelo IrqMonitor (HalGpio no alvo)
class IrqLine
{
public:
    virtual ~IrqLine() = default;

    virtual unsigned int pin() const = 0;

    // Nivel logico ativo (ja considera active-low)
    virtual bool active() const = 0;

    // true se houve borda antes do timeout
    virtual bool wait_irq(int64_t timeout_ns) = 0;
};

#endif
