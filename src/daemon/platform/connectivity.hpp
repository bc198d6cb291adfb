#pragma once

class Connectivity {
public:
    virtual ~Connectivity() = default;
    virtual bool has_active_connection() const = 0;
};
