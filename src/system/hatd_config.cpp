#include "hatd_config.hpp"
#include "hat_registers.hpp"
#include <boost/json.hpp>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace json = boost::json;

// Intervalos em segundos: ate um dia
static constexpr int64_t MAX_INTERVAL_S = 86400;

static std::runtime_error config_error(const std::string& key, const std::string& reason)
{
    return std::runtime_error("hatd config: '" + key + "' " + reason);
}

static int64_t get_int(const json::value& v, const std::string& key)
{
    if(v.is_int64())
        return v.as_int64();
    if(v.is_uint64())
    {
        if(v.as_uint64() > static_cast<uint64_t>(INT64_MAX))
            throw config_error(key, "fora da faixa de inteiros");
        return static_cast<int64_t>(v.as_uint64());
    }

    // Enderecos e mascaras podem vir como "0x40"
    if(v.is_string())
    {
        const char* text = v.as_string().c_str();
        char* end = nullptr;
        errno = 0;
        long long parsed = std::strtoll(text, &end, 0);
        if(errno == 0 && end != text && *end == '\0')
            return parsed;
    }
    throw config_error(key, "deve ser um inteiro");
}

static std::string hex_text(int64_t value)
{
    std::ostringstream out;
    out << "0x" << std::hex << std::uppercase << value;
    return out.str();
}

// Verifica a faixa antes de qualquer conversao para um tipo menor
static int64_t get_ranged(const json::value& v, const std::string& key, int64_t min, int64_t max)
{
    int64_t value = get_int(v, key);
    if(value < min || value > max)
        throw config_error(key, "fora de [" + hex_text(min) + ", " + hex_text(max) + "]: " + std::to_string(value));
    return value;
}

static std::string get_string(const json::value& v, const std::string& key)
{
    if(!v.is_string())
        throw config_error(key, "deve ser uma string");
    return std::string(v.as_string().c_str());
}

static LogLevel parse_log_level(const json::value& v, const std::string& key)
{
    std::string name = get_string(v, key);
    for(LogLevel level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error})
    {
        if(name == to_string(level))
            return level;
    }
    throw config_error(key, "desconhecido: '" + name + "' (debug | info | warning | error)");
}

static CwdtPolicy parse_cwdt(const json::value& v, const std::string& key)
{
    if(!v.is_object())
        throw config_error(key, "deve ser um objeto");

    const json::object& obj = v.as_object();
    const json::value* mode = obj.if_contains("mode");
    if(!mode)
        throw config_error(key + ".mode", "obrigatorio (disabled | keep | feed)");

    std::string name = get_string(*mode, key + ".mode");
    if(name == "disabled")
        return CwdtPolicy::disabled();
    if(name == "keep")
        return CwdtPolicy::keep_board_setting();
    if(name == "feed")
    {
        const json::value* period = obj.if_contains("period_ms");
        if(!period)
            throw config_error(key + ".period_ms", "obrigatorio no modo feed");

        int64_t ms = get_ranged(*period, key + ".period_ms", 1, 0xFFFFFFFFLL);
        return CwdtPolicy::fed(std::chrono::milliseconds(ms));
    }
    throw config_error(key + ".mode", "desconhecido: '" + name + "'");
}

static HatdBoardConfig parse_board(const json::value& v, const std::string& key)
{
    if(!v.is_object())
        throw config_error(key, "deve ser um objeto");
    const json::object& obj = v.as_object();

    const json::value* type = obj.if_contains("type");
    const json::value* address = obj.if_contains("address");
    const json::value* cwdt = obj.if_contains("cwdt");
    if(!type)
        throw config_error(key + ".type", "obrigatorio");
    if(!address)
        throw config_error(key + ".address", "obrigatorio");
    if(!cwdt)
        throw config_error(key + ".cwdt", "obrigatorio (politica do watchdog explicita)");

    HatdBoardConfig board{get_string(*type, key + ".type"), static_cast<int>(get_ranged(*address, key + ".address", 0, 0x7F)),
                          parse_cwdt(*cwdt, key + ".cwdt")};

    const HatBoardType& board_type = find_board_type(board.type);
    if(!board_type.accepts_address(board.address))
        throw config_error(key + ".address", "invalido para " + std::string(board_type.short_name));

    if(const json::value* irq = obj.if_contains("irq"))
    {
        if(!board_type.has_irq)
            throw config_error(key + ".irq", std::string(board_type.short_name) + " nao tem IRQ");
        if(!irq->is_object())
            throw config_error(key + ".irq", "deve ser um objeto");

        const json::object& irq_obj = irq->as_object();
        board.irq_configured = true;
        if(const json::value* rising = irq_obj.if_contains("rising"))
            board.irq_rising = static_cast<uint32_t>(get_ranged(*rising, key + ".irq.rising", 0, 0xFFFFFFFFLL));
        if(const json::value* falling = irq_obj.if_contains("falling"))
            board.irq_falling = static_cast<uint32_t>(get_ranged(*falling, key + ".irq.falling", 0, 0xFFFFFFFFLL));
    }

    return board;
}

HatdConfig parse_hatd_config(const std::string& json_text)
{
    boost::system::error_code ec;
    json::value root = json::parse(json_text, ec);
    if(ec)
        throw std::runtime_error("hatd config: JSON invalido: " + ec.message());
    if(!root.is_object())
        throw config_error("/", "deve ser um objeto");

    const json::object& obj = root.as_object();
    HatdConfig config;

    if(const json::value* v = obj.if_contains("bus"))
        config.bus = get_string(*v, "bus");
    if(const json::value* v = obj.if_contains("gpio_chip"))
        config.gpio_chip = get_string(*v, "gpio_chip");
    if(const json::value* v = obj.if_contains("irq_pin"))
        config.irq_pin = static_cast<int>(get_ranged(*v, "irq_pin", 0, INT_MAX));
    if(const json::value* v = obj.if_contains("status_interval_s"))
        config.status_interval = std::chrono::seconds(get_ranged(*v, "status_interval_s", 1, MAX_INTERVAL_S));
    if(const json::value* v = obj.if_contains("systemd_watchdog_s"))
        config.systemd_watchdog = std::chrono::seconds(get_ranged(*v, "systemd_watchdog_s", 1, MAX_INTERVAL_S));
    if(const json::value* v = obj.if_contains("log_level"))
        config.log_level = parse_log_level(*v, "log_level");

    const json::value* boards = obj.if_contains("boards");
    if(!boards || !boards->is_array() || boards->as_array().empty())
        throw config_error("boards", "deve ser uma lista nao vazia");

    const json::array& list = boards->as_array();
    for(size_t i = 0; i < list.size(); i++)
    {
        config.boards.push_back(parse_board(list[i], "boards[" + std::to_string(i) + "]"));
    }

    return config;
}

HatdConfig load_hatd_config(const std::string& path)
{
    std::ifstream file(path);
    if(!file)
        throw std::runtime_error("hatd config: falha ao abrir " + path);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_hatd_config(buffer.str());
}
