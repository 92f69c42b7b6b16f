#pragma once

namespace proto
{

enum class Error
{
    None = 0,
    MessageTooLarge,       // needs more than 255 chunks; raised before any I/O
    UnknownMessageKind,    // kind tag or header separator not recognised
    InvalidFileName,       // empty name, or name contains the name separator
    MalformedFilePayload,  // file payload without a name separator
    AckCorrupted,          // ack marker != 0, fatal for the current send
    ReceiveTimeout,        // overall receive window elapsed, message abandoned
    SendTimeout,           // overall send window elapsed during ack rounds
    PacketDecodeFailure,   // transport could not recover a packet
    TransportFailure,      // transport refused to start or to send
    Busy,                  // another session already owns the transport
    Cancelled,             // cancel() was called while waiting
    IoError                // clipboard / file system collaborator failed
};

inline const char *error_name(Error e)
{
    switch (e)
    {
        case Error::None:
            return "None";
        case Error::MessageTooLarge:
            return "MessageTooLarge";
        case Error::UnknownMessageKind:
            return "UnknownMessageKind";
        case Error::InvalidFileName:
            return "InvalidFileName";
        case Error::MalformedFilePayload:
            return "MalformedFilePayload";
        case Error::AckCorrupted:
            return "AckCorrupted";
        case Error::ReceiveTimeout:
            return "ReceiveTimeout";
        case Error::SendTimeout:
            return "SendTimeout";
        case Error::PacketDecodeFailure:
            return "PacketDecodeFailure";
        case Error::TransportFailure:
            return "TransportFailure";
        case Error::Busy:
            return "Busy";
        case Error::Cancelled:
            return "Cancelled";
        case Error::IoError:
            return "IoError";
    }
    return "?";
}

// Human readable explanation, used for the CLI's final status line.
inline const char *error_text(Error e)
{
    switch (e)
    {
        case Error::None:
            return "ok";
        case Error::MessageTooLarge:
            return "message is too large to send (more than 255 packets)";
        case Error::UnknownMessageKind:
            return "received a message of unknown kind";
        case Error::InvalidFileName:
            return "file name cannot be sent";
        case Error::MalformedFilePayload:
            return "received file payload has no name";
        case Error::AckCorrupted:
            return "acknowledgment packet corrupted, peers out of sync";
        case Error::ReceiveTimeout:
            return "message never completed, gave up waiting";
        case Error::SendTimeout:
            return "peer kept requesting packets, gave up sending";
        case Error::PacketDecodeFailure:
            return "packet could not be decoded";
        case Error::TransportFailure:
            return "transport failure";
        case Error::Busy:
            return "transport is busy with another message";
        case Error::Cancelled:
            return "cancelled";
        case Error::IoError:
            return "local I/O failure";
    }
    return "?";
}

}  // namespace proto
