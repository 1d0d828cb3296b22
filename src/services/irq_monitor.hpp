#ifndef IRQ_MONITOR_HPP
#define IRQ_MONITOR_HPP

#include "hat_board.hpp"
#include "hat_irq_event.hpp"
#include "hat_log.hpp"
#include "irq_line.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

using IrqEventCallback = std::function<void(HatBoard&, const HatIrqEvent&)>;

// Espera a linha de IRQ compartilhada (ativa em nivel baixo) e esvazia a
// fila de captura de todas as placas com IRQ.
// Falhas de uma placa ou do callback sao registradas no log; a thread continua.
class IrqMonitor
{
public:
    IrqMonitor(IrqLine& irq_line, std::vector<HatBoard*> boards, LogSink log);
    ~IrqMonitor();

    void start();
    void stop();

    void set_event_callback(IrqEventCallback cb);

    // Uma passada em todas as placas; retorna o numero de eventos
    size_t poll();

private:
    IrqLine& _irq_line;
    std::vector<HatBoard*> _boards;
    LogSink _log;

    std::mutex _cb_mutex;
    IrqEventCallback _event_cb;

    std::atomic<bool> _running{false};
    std::thread _monitor_thread;

    void monitor_loop();
};

#endif
