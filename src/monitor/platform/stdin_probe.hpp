#pragma once

class StdinProbe {
public:
    virtual ~StdinProbe() = default;
    virtual bool reading_stdin(int pid) const = 0;
};
