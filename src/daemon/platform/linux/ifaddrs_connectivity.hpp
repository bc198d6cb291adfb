#pragma once

#include "platform/connectivity.hpp"

// Connected when any non-loopback interface is up, running and has an address.
class IfaddrsConnectivity : public Connectivity {
public:
    bool has_active_connection() const override;
};
