#ifndef HAT_DIGITAL_HPP
#define HAT_DIGITAL_HPP

#include "hat_register_file.hpp"
#include "hat_registers.hpp"
#include <cstdint>
#include <string>
#include <vector>

/* Entradas digitais.
 * value(): bitmap de todos os canais, bit i = canal i.
 * Canais por indice (a partir de 0) ou pelo rotulo impresso na placa.
 * Contadores de borda ficam no hardware; so aceitam reset (escrita de 0). */
class HatDigitalInputs
{
public:
    HatDigitalInputs(HatRegisterFile& regs, const HatRegisterMap& map);

    const ChannelMap& channels() const { return _map.di_channels(); }
    const std::vector<std::string>& labels() const { return channels().labels(); }

    uint32_t value();

    bool channel(size_t index);
    bool channel(const std::string& label);

    uint32_t counter(HatEdge edge, size_t index);
    uint32_t counter(HatEdge edge, const std::string& label);

    // value diferente de 0 -> OutOfRange, sem transacao
    void reset_counter(HatEdge edge, size_t index, uint32_t value = 0);
    void reset_counter(HatEdge edge, const std::string& label, uint32_t value = 0);

    // Todos os canais, subida e descida
    void reset_counters();

private:
    HatRegisterFile& _regs;
    const HatRegisterMap& _map;
};

/* Saidas digitais.
 * channel() / set_channel() usam os comandos de canal unico da placa: uma transacao,
 * sem leitura-modificacao-escrita, os outros canais nao sao tocados.
 * Para mudar varios canais de uma vez use set_value(). */
class HatDigitalOutputs
{
public:
    HatDigitalOutputs(HatRegisterFile& regs, const HatRegisterMap& map);

    const ChannelMap& channels() const { return _map.dq_channels(); }
    const std::vector<std::string>& labels() const { return channels().labels(); }

    uint32_t value();
    void set_value(uint32_t value);

    bool channel(size_t index);
    bool channel(const std::string& label);
    void set_channel(size_t index, bool state);
    void set_channel(const std::string& label, bool state);

    // Estado das saidas ao ligar a placa
    uint32_t power_on_value();
    void set_power_on_value(uint32_t value);

    // Estado das saidas apos timeout do CWDT
    uint32_t safety_value();
    void set_safety_value(uint32_t value);

private:
    HatRegisterFile& _regs;
    const HatRegisterMap& _map;

    void check_value(uint32_t value) const;
};

#endif
