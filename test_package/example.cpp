#include <iostream>
#include <string>
#include <vector>

#include <tally.hpp>

int
main()
{
    // Smoke test for <tally/assert.hpp>
    //
    TALLY_CHECK_EQ(1 + 1, 2);

    // Smoke test for <tally/config.hpp>
    //
    if (TALLY_HINT_TRUE(2 * 2 == 4)) {
        std::cout << "Math is working." << std::endl;
    }

    // Smoke test for <tally/int_types.hpp>
    //
    tally::usize n = 3;

    // Smoke test for <tally/seq.hpp>
    //
    namespace seq = tally::seq;

    std::vector<int> v = {2, 3, 2, 4, 2, 5};
    auto is_two = [](int i) {
        return i == 2;
    };

    TALLY_CHECK(tally::as_seq(v) | seq::at_least(n, is_two));
    TALLY_CHECK(tally::as_seq(v) | seq::at_most(n, is_two));
    TALLY_CHECK(tally::as_seq(v) | seq::exactly_n(n, is_two));
    TALLY_CHECK(!(tally::as_seq(v) | seq::all_or_none(is_two)));
    TALLY_CHECK(tally::as_seq(v) | seq::perfectly_balanced(is_two));

    std::string letters = "ab";
    std::string digits = "12";

    const std::vector<char> mixed = seq::alternate(tally::as_seq(letters), tally::as_seq(digits))  //
                                    | seq::collect_vec();

    TALLY_CHECK_EQ(std::string(mixed.begin(), mixed.end()), "a1b2");

    // Smoke test for <tally/utility.hpp>
    //
    std::vector<int> v_copy = tally::make_copy(v);
    TALLY_CHECK_EQ(v_copy.size(), v.size());

    // Smoke test for <tally/logging.hpp>
    //
    TALLY_LOG(INFO) << "tally smoke test passed";

    return 0;
}
