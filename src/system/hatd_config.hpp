#ifndef HATD_CONFIG_HPP
#define HATD_CONFIG_HPP

#include "hat_cwdt.hpp"
#include "hat_log.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct HatdBoardConfig
{
    std::string type; // "DI16ac", "DQ10rly", ...
    int address;
    CwdtPolicy cwdt;

    // Mascaras de borda do IRQ (so placas com IRQ)
    bool irq_configured{false};
    uint32_t irq_rising{0};
    uint32_t irq_falling{0};
};

struct HatdConfig
{
    std::string bus{"/dev/i2c-1"};
    std::string gpio_chip{"/dev/gpiochip0"};
    int irq_pin{21}; // BCM
    std::chrono::seconds status_interval{5};
    std::chrono::seconds systemd_watchdog{2};
    LogLevel log_level{LogLevel::Info};
    std::vector<HatdBoardConfig> boards;
};

// std::runtime_error com a chave problematica em caso de erro
HatdConfig parse_hatd_config(const std::string& json_text);
HatdConfig load_hatd_config(const std::string& path);

#endif
