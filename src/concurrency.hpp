#pragma once

#include <atomic>

namespace fp {

/*
 * Created -> Running -> Stopped, or Created -> Stopped. Each transition is
 * taken by exactly one caller, every other caller observes false.
 */
class Lifecycle {
public:
    enum class State {
        Created,
        Running,
        Stopped
    };

    Lifecycle() : m_state{State::Created} {}

    bool start()
    {
        State expected = State::Created;
        return m_state.compare_exchange_strong(expected, State::Running);
    }

    /* returns the state the stop transitioned from, or Stopped if it was
     * already stopped */
    State stop() { return m_state.exchange(State::Stopped); }

    State state() const { return m_state.load(); }

private:
    std::atomic<State> m_state;
};

} // namespace fp
