#pragma once
#include <chrono>
#include <string>

namespace prc {

struct WallTimer {
    using clock = std::chrono::steady_clock;
    clock::time_point t0, t1;
    void start() { t0 = clock::now(); }
    void stop()  { t1 = clock::now(); }
    double ms() const { return std::chrono::duration<double, std::milli>(t1 - t0).count(); }
};

struct stage_timing {
    std::string name;
    double ms = 0.0;
};

// Times one pipeline stage; the result lands in the run summary.
class StageTimer {
public:
    explicit StageTimer(const char* n) : name_(n ? n : "(stage)") { wt_.start(); }
    stage_timing stop() { wt_.stop(); return stage_timing{name_, wt_.ms()}; }

private:
    std::string name_;
    WallTimer   wt_{};
};

}
