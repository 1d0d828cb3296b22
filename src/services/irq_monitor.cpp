#include "irq_monitor.hpp"
#include "hat_error.hpp"
#include <chrono>

// Timeout de espera da borda, para o loop perceber o stop()
static constexpr int64_t WAIT_TIMEOUT_NS = 100 * 1000 * 1000;

IrqMonitor::IrqMonitor(IrqLine& irq_line, std::vector<HatBoard*> boards, LogSink log)
    : _irq_line(irq_line), _log(log)
{
    for(HatBoard* board : boards)
    {
        if(board && board->has_irq())
            _boards.push_back(board);
    }
}

IrqMonitor::~IrqMonitor()
{
    stop();
}

void IrqMonitor::start()
{
    if(!_running)
    {
        _running = true;
        _monitor_thread = std::thread(&IrqMonitor::monitor_loop, this);
        _log(LogLevel::Info, "IRQ", "Monitoramento iniciado (GPIO " + std::to_string(_irq_line.pin()) + ", " +
                                        std::to_string(_boards.size()) + " placa(s))");
    }
}

void IrqMonitor::stop()
{
    _running = false;
    if(_monitor_thread.joinable())
    {
        _monitor_thread.join();
    }
}

void IrqMonitor::set_event_callback(IrqEventCallback cb)
{
    std::lock_guard<std::mutex> lock(_cb_mutex);
    _event_cb = cb;
}

size_t IrqMonitor::poll()
{
    IrqEventCallback cb;
    {
        std::lock_guard<std::mutex> lock(_cb_mutex);
        cb = _event_cb;
    }

    size_t total = 0;
    for(HatBoard* board : _boards)
    {
        try
        {
            total += board->irq().drain([&](const HatIrqEvent& event) {
                if(cb)
                    cb(*board, event);
            });
        }
        catch(const HatError& e)
        {
            // Uma placa com falha nao impede as outras de liberarem a linha
            _log(e.is_transport_fault() ? LogLevel::Warning : LogLevel::Error, "IRQ",
                 board->to_string() + ": " + e.what());
        }
        catch(const std::exception& e)
        {
            // Excecao do callback da aplicacao
            _log(LogLevel::Error, "IRQ", board->to_string() + ": callback falhou: " + e.what());
        }
    }
    if(total > 0)
        _log(LogLevel::Debug, "IRQ", std::to_string(total) + " evento(s) lidos");
    return total;
}

void IrqMonitor::monitor_loop()
{
    while(_running)
    {
        try
        {
            _irq_line.wait_irq(WAIT_TIMEOUT_NS);

            // Linha ativa em nivel baixo: enquanto estiver ativa ha captura pendente
            if(_irq_line.active())
            {
                poll();
            }
        }
        catch(const HatError& e)
        {
            // Falha da linha: nao girar em laco apertado
            _log(LogLevel::Error, "IRQ", std::string("GPIO ") + std::to_string(_irq_line.pin()) + ": " + e.what());
            std::this_thread::sleep_for(std::chrono::nanoseconds(WAIT_TIMEOUT_NS));
        }
    }
}
