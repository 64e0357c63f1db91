#pragma once

#include "core/types.hpp"
#include "network/discovery.hpp"

#include <QSettings>
#include <QString>
#include <cstdint>

namespace manuscripts::app {

constexpr uint16_t DEFAULT_PORT = 8765;

/**
 * ReceiverSettings - What `manuscripts receive` remembers between runs.
 *
 * The passphrase is never stored; it is read again on every start.
 */
struct ReceiverSettings {
    QString display_name;
    uint16_t port = DEFAULT_PORT;
    QString destination;
    network::ServiceMode mode = network::ServiceMode::Receiver;
    Uuid instance_id;
};

// ~/Downloads/Submissions for receivers, ~/Downloads/Shared for share mode.
QString default_destination(network::ServiceMode mode);

// "Teacher" for receivers, the host name in share mode.
QString default_display_name(network::ServiceMode mode);

/**
 * Read receiver/* keys, filling gaps with defaults. Creates and stores the
 * instance id on first use so the advertised identity survives restarts.
 */
ReceiverSettings load_receiver_settings(QSettings& settings);

void save_receiver_settings(QSettings& settings, const ReceiverSettings& values);

Uuid get_or_create_instance_id(QSettings& settings);

} // namespace manuscripts::app
