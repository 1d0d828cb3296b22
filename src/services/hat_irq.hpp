#ifndef HAT_IRQ_HPP
#define HAT_IRQ_HPP

#include "hat_irq_event.hpp"
#include "hat_register_file.hpp"
#include "hat_registers.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

// IRQ das placas DI16ac / DI6acDQ6xxx.
// A linha de interrupcao compartilhada e monitorada fora daqui (IrqMonitor);
// esta classe so configura as bordas e le/limpa o registrador de captura.
class HatIrq
{
public:
    using EventCallback = std::function<void(const HatIrqEvent&)>;

    HatIrq(HatRegisterFile& regs, const HatRegisterMap& map);

    // Mascaras independentes por canal de entrada
    uint32_t rising_edge_control();
    void set_rising_edge_control(uint32_t mask);
    uint32_t falling_edge_control();
    void set_falling_edge_control(uint32_t mask);

    // Le (e desenfileira) uma captura; 0 = fila vazia
    uint32_t capture();

    // std::nullopt quando a fila esta vazia
    std::optional<HatIrqEvent> read_event();

    // Escreve 0: limpa a fila e libera a linha de interrupcao
    void clear_capture();

    // Le ate a captura voltar 0. Retorna quantos eventos foram entregues.
    size_t drain(const EventCallback& callback);

private:
    HatRegisterFile& _regs;
    const HatRegisterMap& _map;

    void check_mask(uint32_t mask) const;
};

#endif
