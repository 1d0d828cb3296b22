#ifndef HAT_ERROR_HPP
#define HAT_ERROR_HPP

#include <stdexcept>
#include <string>

enum class HatErrorKind
{
    DeviceNotFound, // Sem ACK no endereco configurado
    TransferError,  // Falha no meio da transacao (arbitragem, NACK, leitura curta)
    InvalidAccess,  // Registrador/canal inexistente ou modo de acesso errado
    OutOfRange,     // Valor fora do dominio aceito
    BoardMismatch   // Placa respondeu com outro nome
};

const char* to_string(HatErrorKind kind);

class HatError : public std::runtime_error
{
public:
    HatError(HatErrorKind kind, const std::string& message);

    HatErrorKind kind() const noexcept { return _kind; }

    // Falhas de barramento podem ser repetidas pelo chamador; as demais sao erro de programacao.
    bool is_transport_fault() const noexcept
    {
        return _kind == HatErrorKind::DeviceNotFound || _kind == HatErrorKind::TransferError;
    }

private:
    HatErrorKind _kind;
};

#endif
