#include "lincomb.hpp"
#include <complex>
#include <iostream>
#include <map>
#include <string>

using namespace lincomb;

// ---- Main Driver ----
int
main() {
    // --- Labels as vectors ---
    std::cout << "--- Label Keys ---" << '\n';
    {
        Label const x("X", 0);
        Label const y("Y", 0);
        Label const z("Z", 1);

        SparseLinearCombination<Label> const a({ { x, 1.0 }, { y, -2.0 } });
        SparseLinearCombination<Label> const b({ { y, 2.0 }, { z, Scalar(0.0, 0.5) } });

        std::cout << "a: " << a << '\n';                  // 1.000*X0-2.000*Y0
        std::cout << "b: " << b << '\n';                  // 2.000*Y0+0.500j*Z1
        std::cout << "a + b = " << a + b << '\n';         // 1.000*X0+0.500j*Z1
        std::cout << "a - b = " << a - b << '\n';         // 1.000*X0-4.000*Y0-0.500j*Z1
        std::cout << "-a = " << -a << '\n';               // -1.000*X0+2.000*Y0
        std::cout << "2i * a = " << Scalar(0, 2) * a << '\n'; // 2.000j*X0-4.000j*Y0
        std::cout << "a / 4 = " << a / 4.0 << '\n';       // 0.250*X0-0.500*Y0
        std::cout << "a + (-a) = " << a + (-a) << '\n';   // 0
        std::cout << "repr(b) = " << b.repr() << '\n';    // SparseLinearCombination({Y0: (2+0j), Z1: 0.5j})
    }

    // --- Update versus addition ---
    std::cout << "\n--- Update vs Addition ---" << '\n';
    {
        SparseLinearCombination<std::string> overwritten({ { "x", 1.0 } });
        overwritten.update({ { "x", 2.0 } });
        std::cout << "update: " << overwritten << '\n'; // 2.000*x

        SparseLinearCombination<std::string> summed({ { "x", 1.0 } });
        summed += SparseLinearCombination<std::string>({ { "x", 2.0 } });
        std::cout << "+=: " << summed << '\n'; // 3.000*x
    }

    // --- Custom format specs ---
    std::cout << "\n--- Formatting ---" << '\n';
    {
        std::map<std::string, std::complex<double>> const terms = {
            { "a", { 1.0, 2.0 } }, { "b", { -1.0, -2.0 } }, { "c", { 0.5, -0.25 } }, { "d", { 1e-6, 0.0 } }
        };
        SparseLinearCombination<std::string> const c(terms);
        std::cout << "default: " << c << '\n';             // (1.000+2.000j)*a-(1.000+2.000j)*b+(0.500-0.250j)*c
        std::cout << ".1f: " << c.format(".1f") << '\n';
        std::cout << "+.2e: " << c.format("+.2e") << '\n';
        std::cout << "after clean(1e-3): " << c.copy().clean(1e-3).size() << " terms" << '\n'; // 3 terms
    }

    // --- Approximate equality ---
    std::cout << "\n--- Approximate Equality ---" << '\n';
    {
        SparseLinearCombination<std::string> const p({ { "u", 0.1 }, { "v", 0.2 } });
        SparseLinearCombination<std::string> const q = (p * 3.0) / 3.0;
        std::cout << std::boolalpha;
        std::cout << "p == (p*3)/3: " << (p == q) << '\n';
        std::cout << "approx_eq(p, (p*3)/3): " << approx_eq(p, q) << '\n'; // true
    }

    return 0;
}
