/** \file
 *
 * \brief Definition of Blackjack::FunctionObserver
 */

#ifndef FUNCTIONOBSERVER_HH_
#define FUNCTIONOBSERVER_HH_

#include "Observer.hh"

#include <memory>
#include <type_traits>
#include <utility>

namespace Blackjack {

/** \brief Observer that forwards its notifications to a function
 *
 * \tparam Function type of the underlying function
 * \tparam T observer parameters
 */
template<typename Function, typename... T>
class FunctionObserver : public Observer<T...> {
public:

    /** \brief Create new function observer
     *
     * \param function the function called on each notification
     */
    explicit FunctionObserver(Function function);

private:

    void handleNotify(const T&... args) override;

    Function function;
};

template<typename Function, typename... T>
FunctionObserver<Function, T...>::FunctionObserver(Function function) :
    function {std::move(function)}
{
}

template<typename Function, typename... T>
void FunctionObserver<Function, T...>::handleNotify(const T&... args)
{
    function(args...);
}

/** \brief Wrap a function into Observer
 *
 * \param function the function to wrap
 *
 * \return std::shared_ptr to the FunctionObserver wrapping \p function
 */
template<typename... T, typename Function>
auto makeObserver(Function&& function)
{
    return std::make_shared<FunctionObserver<std::decay_t<Function>, T...>>(
        std::forward<Function>(function));
}

}

#endif // FUNCTIONOBSERVER_HH_
