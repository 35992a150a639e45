/** \file
 *
 * \brief Definition of Blackjack::FunctionQueue class
 */

#ifndef FUNCTIONQUEUE_HH_
#define FUNCTIONQUEUE_HH_

#include <functional>
#include <list>

namespace Blackjack {

/** \brief Function queue
 *
 * FunctionQueue serializes calls to functions that must not overlap. A
 * function given to the queue is called immediately if the queue is idle. If
 * it is given while another function is running (for instance from an
 * observer notified by that function), it is called after the running
 * function and every function queued before it have returned.
 */
class FunctionQueue {
public:

    /** \brief Enqueue function for execution
     *
     * If any of the queued functions throws, the queue is cleared and the
     * exception is rethrown.
     *
     * \note If \p function captures automatic variables by reference, the
     * caller must ensure the queue is idle when calling this method.
     *
     * \param function The function to enqueue. It is invoked without
     * arguments and its return value is ignored.
     */
    template<typename Function>
    void operator()(Function&& function);

private:

    void internalProcessQueue();

    std::list<std::function<void()>> functions;
};

template<typename Function>
void FunctionQueue::operator()(Function&& function)
{
    try {
        functions.emplace_back(std::forward<Function>(function));
        if (functions.size() == 1) {
            internalProcessQueue();
        }
    } catch(...) {
        functions.clear();
        throw;
    }
}

inline void FunctionQueue::internalProcessQueue()
{
    while (!functions.empty()) {
        (functions.front())();
        functions.pop_front();
    }
}

}

#endif // FUNCTIONQUEUE_HH_
