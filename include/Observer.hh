/** \file
 *
 * \brief Definition of an implementation of the observer pattern
 *
 * The engine publishes its events (cards dealt, shoe replenished, state
 * changes) through the Observable class template. Anything interested in the
 * events, such as a renderer or a network session, implements Observer.
 *
 * The classes are not meant for inter‐thread communication and are not
 * thread safe.
 */

#ifndef OBSERVER_HH_
#define OBSERVER_HH_

#include "FunctionQueue.hh"

#include <list>
#include <memory>
#include <tuple>
#include <utility>

namespace Blackjack {

/** \brief Observer part of the observer pattern implementation
 *
 * \sa Observable
 */
template<typename... T>
class Observer {
public:

    virtual ~Observer() = default;

    /** \brief Notify observer
     *
     * \param args parameters from Observable::notifyAll
     */
    void notify(const T&... args);

private:

    /** \brief Handle for notifying the observer
     *
     * \sa notify()
     */
    virtual void handleNotify(const T&... args) = 0;
};

template<typename... T>
void Observer<T...>::notify(const T&... args)
{
    handleNotify(args...);
}

/** \brief Observable part of the observer pattern
 *
 * \note Notifications issued while a notification is ongoing are queued and
 * delivered after every observer has received the ongoing one.
 */
template<typename... T>
class Observable {
public:

    /** \brief Subscribe observer to this Observable
     *
     * The observable only holds a weak reference. An observer whose lifetime
     * has ended is dropped on the next notification.
     *
     * \param observer the observer to be registered
     */
    void subscribe(std::weak_ptr<Observer<T...>> observer);

    /** \brief Notify all observers
     *
     * \param args arguments for Observer::notify
     */
    template<typename... U>
    void notifyAll(U&&... args);

private:

    template<std::size_t... Ns>
    void internalNotifyAllHelper(
        const std::tuple<T...>& args, std::index_sequence<Ns...>);

    std::list<std::weak_ptr<Observer<T...>>> observers;
    FunctionQueue functionQueue;
};

template<typename... T>
void Observable<T...>::subscribe(std::weak_ptr<Observer<T...>> observer)
{
    observers.emplace_back(std::move(observer));
}

template<typename... T>
template<typename... U>
void Observable<T...>::notifyAll(U&&... args)
{
    functionQueue(
        [this, args = std::tuple<T...> {std::forward<U>(args)...}]()
        {
            internalNotifyAllHelper(args, std::index_sequence_for<T...> {});
        });
}

template<typename... T>
template<std::size_t... Ns>
void Observable<T...>::internalNotifyAllHelper(
    const std::tuple<T...>& args, std::index_sequence<Ns...>)
{
    for (auto iter = observers.begin(); iter != observers.end(); ) {
        if (auto observer = iter->lock()) {
            observer->notify(std::get<Ns>(args)...);
            ++iter;
        } else {
            iter = observers.erase(iter);
        }
    }
}

}

#endif // OBSERVER_HH_
