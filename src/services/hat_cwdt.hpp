#ifndef HAT_CWDT_HPP
#define HAT_CWDT_HPP

#include "cwdt_feeder.hpp"
#include "hat_log.hpp"
#include "hat_register_file.hpp"
#include "hat_registers.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

// Politica do CWDT na construcao da placa. Nao ha valor padrao: o chamador decide.
struct CwdtPolicy
{
    enum class Mode
    {
        Disable,          // escreve periodo 0
        KeepBoardSetting, // nao toca no CWDT
        Feed              // escreve o periodo e inicia a alimentacao
    };

    Mode mode;
    std::chrono::milliseconds period;

    static CwdtPolicy disabled() { return {Mode::Disable, std::chrono::milliseconds(0)}; }
    static CwdtPolicy keep_board_setting() { return {Mode::KeepBoardSetting, std::chrono::milliseconds(0)}; }
    static CwdtPolicy fed(std::chrono::milliseconds period) { return {Mode::Feed, period}; }
};

struct CwdtState
{
    bool enabled;                                    // periodo conhecido > 0
    std::optional<std::chrono::milliseconds> period; // vazio se nunca lido/escrito
    bool feeding;
    uint64_t feed_count;
    uint64_t failure_count;
    std::string last_error;
};

class HatCwdt
{
public:
    HatCwdt(HatRegisterFile& regs, const HatRegisterMap& map, LogSink log);
    ~HatCwdt();

    HatCwdt(const HatCwdt&) = delete;
    HatCwdt& operator=(const HatCwdt&) = delete;

    std::chrono::milliseconds period();
    void set_period(std::chrono::milliseconds period);

    // Explicitos e idempotentes: retornam true se o estado mudou
    bool start_feeding();
    bool stop_feeding();
    bool feeding() const { return _feeder.running(); }

    // Um quadro valido alimenta o CWDT: le o periodo, sincrono
    void feed();

    void apply(const CwdtPolicy& policy);

    CwdtState state() const;
    const CwdtFeeder& feeder() const { return _feeder; }

    // Metade do periodo, como o firmware recomenda
    static std::chrono::milliseconds feed_interval(std::chrono::milliseconds period);

private:
    HatRegisterFile& _regs;
    const HatRegisterMap& _map;
    LogSink _log;

    mutable std::mutex _period_mutex;
    std::optional<std::chrono::milliseconds> _period;

    // Declarado por ultimo: e destruido (thread parada) antes dos demais membros
    CwdtFeeder _feeder;
};

#endif
