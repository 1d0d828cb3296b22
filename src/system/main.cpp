#include <iostream>
#include <csignal>
#include <cstdio>
#include <chrono>
#include <memory>
#include <vector>
#include <boost/asio.hpp>
#include <systemd/sd-daemon.h>

#include "hal_gpio.hpp"
#include "hat_board.hpp"
#include "hat_log.hpp"
#include "hatd_config.hpp"
#include "irq_monitor.hpp"
#include "status_reporter.hpp"

static const char* DEFAULT_CONFIG_PATH = "/etc/i2c-hats/hatd.json";

// --- WATCHDOG DO SYSTEMD ---
// Chamado periodicamente pelo io.run(); prova que o loop de eventos esta vivo
static void watchdog_pulse(const boost::system::error_code& error, boost::asio::steady_timer* t,
                           std::chrono::seconds period)
{
    if(error)
        return;

    sd_notify(0, "WATCHDOG=1");

    t->expires_after(period);
    t->async_wait([t, period](const boost::system::error_code& ec) { watchdog_pulse(ec, t, period); });
}

int main(int argc, char* argv[])
{
    // Logs imediatos no journalctl
    std::setvbuf(stdout, nullptr, _IONBF, 0);

    const std::string config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;
    LogSink log = console_log_sink();

    try
    {
        HatdConfig config = load_hatd_config(config_path);
        log = console_log_sink(config.log_level);
        log(LogLevel::Info, "SYSTEM", "Configuracao: " + config_path + " (" + std::to_string(config.boards.size()) +
                                          " placa(s) em " + config.bus + ")");

        // 1. Placas (politica do CWDT aplicada na construcao)
        std::vector<std::unique_ptr<HatBoard>> boards;
        std::vector<HatBoard*> board_ptrs;
        bool any_irq = false;

        for(const HatdBoardConfig& board_cfg : config.boards)
        {
            const HatBoardType& type = find_board_type(board_cfg.type);
            std::unique_ptr<HatBoard> board = HatBoard::open(type, board_cfg.address, board_cfg.cwdt, config.bus, log);

            if(board_cfg.irq_configured)
            {
                board->irq().set_rising_edge_control(board_cfg.irq_rising);
                board->irq().set_falling_edge_control(board_cfg.irq_falling);
                board->irq().clear_capture();
                any_irq = true;
            }

            board_ptrs.push_back(board.get());
            boards.push_back(std::move(board));
        }

        // 2. Loop de eventos: status + watchdog do systemd
        boost::asio::io_context io;

        StatusReporter reporter(
            io, board_ptrs, config.status_interval,
            [](const std::string& payload) { std::cout << payload << std::endl; }, log);

        // 3. IRQ compartilhado (somente se alguma placa usa)
        std::unique_ptr<HalGpio> irq_line;
        std::unique_ptr<IrqMonitor> irq_monitor;
        if(any_irq)
        {
            irq_line = std::make_unique<HalGpio>(static_cast<unsigned int>(config.irq_pin), HalGpio::Edge::Both,
                                                 HalGpio::Bias::PullUp, true, config.gpio_chip.c_str());
            irq_monitor = std::make_unique<IrqMonitor>(*irq_line, board_ptrs, log);

            // Eventos publicados na thread do io_context, junto com o status
            irq_monitor->set_event_callback([&io, &reporter](HatBoard& board, const HatIrqEvent& event) {
                boost::asio::post(io, [&reporter, &board, event]() { reporter.publish_irq_event(board, event); });
            });
        }

        boost::asio::steady_timer watchdog_timer(io, config.systemd_watchdog);
        const std::chrono::seconds watchdog_period = config.systemd_watchdog;
        watchdog_timer.async_wait(
            [&](const boost::system::error_code& ec) { watchdog_pulse(ec, &watchdog_timer, watchdog_period); });

        // Sinais do SO
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if(ec)
                return;
            log(LogLevel::Info, "SYSTEM", "Sinal " + std::to_string(signal) + " recebido. Parando...");
            sd_notify(0, "STOPPING=1");

            // Para a thread de IRQ antes de fechar as placas
            if(irq_monitor)
                irq_monitor->stop();
            reporter.stop();
            watchdog_timer.cancel();
            io.stop();
        });

        // Start
        reporter.start();
        if(irq_monitor)
            irq_monitor->start();

        sd_notify(0, "READY=1");
        log(LogLevel::Info, "SYSTEM", "Online. Aguardando eventos...");

        io.run();

        // Alimentadores do CWDT param no destrutor de cada placa
        irq_monitor.reset();
        boards.clear();
    }
    catch(const std::exception& e)
    {
        log(LogLevel::Error, "FATAL", e.what());
        return 1;
    }

    return 0;
}
