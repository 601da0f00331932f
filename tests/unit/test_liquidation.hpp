#pragma once

namespace lendcore::tests {

void test_liquidation_clamps_payout();
void test_liquidation_pays_bonus();
void test_liquidation_rejections();
void test_liquidation_rolls_back_failed_payout();
void test_liquidation_zero_price();

}  // namespace lendcore::tests
