#pragma once

namespace apdulink
{

// Failure codes surfaced by the session layer and the controller.
enum class Error
{
    Ok = 0,
    RadioNotReady,           // adapter missing or not powered
    UserCancelledOpen,       // device selection aborted or timed out upstream
    DeviceDisconnected,      // no live session for the id, or link dropped mid-operation
    ServiceNotFound,         // expected GATT service missing
    CharacteristicNotFound,  // write or notify characteristic missing
    NegotiationFailed,       // no MTU answer before timeout or disconnect
    MalformedFrame,          // frame too short or unknown tag
    ProtocolError,           // sequence mismatch, length overrun, oversized message
    WriteFailed              // link reported a failed write acknowledgement
};

inline const char *error_name(Error e)
{
    switch (e)
    {
        case Error::Ok:
            return "Ok";
        case Error::RadioNotReady:
            return "RadioNotReady";
        case Error::UserCancelledOpen:
            return "UserCancelledOpen";
        case Error::DeviceDisconnected:
            return "DeviceDisconnected";
        case Error::ServiceNotFound:
            return "ServiceNotFound";
        case Error::CharacteristicNotFound:
            return "CharacteristicNotFound";
        case Error::NegotiationFailed:
            return "NegotiationFailed";
        case Error::MalformedFrame:
            return "MalformedFrame";
        case Error::ProtocolError:
            return "ProtocolError";
        case Error::WriteFailed:
            return "WriteFailed";
    }
    return "?";
}

}  // namespace apdulink
