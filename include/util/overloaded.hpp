#ifndef OVERLOADED_HPP
#define OVERLOADED_HPP

// Builds a visitor for std::visit from a set of lambdas
template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

#endif // OVERLOADED_HPP
