#include <cassert>
#include <cmath>

#include "synthex/liquidity.hpp"

int main()
{
  using synthex::Side;

  // ----------------------------
  // 1) Square-root impact, signed by taker side
  // ----------------------------
  {
    synthex::LiquidityModel m(10'000.0);
    assert(m.thinness() == 1.0);

    const double up = m.impact_of(Side::Buy, 100);
    const double down = m.impact_of(Side::Sell, 100);
    assert(std::fabs(up - 0.1 * std::sqrt(0.01)) < 1e-12);
    assert(up == -down);
    assert(m.impact_of(Side::Buy, 0) == 0.0);

    // Larger orders move the price more, but less than proportionally
    const double big = m.impact_of(Side::Buy, 400);
    assert(big > up && big < 4.0 * up);
  }

  // ----------------------------
  // 2) Fills deplete depth, impact accumulates until taken
  // ----------------------------
  {
    synthex::LiquidityModel m(1'000.0);
    const double i1 = m.on_fill(Side::Buy, 100);
    const double i2 = m.on_fill(Side::Sell, 100);
    assert(m.current() == 800.0);
    assert(i2 < 0.0 && -i2 > i1); // thinner book, larger impact

    const double pending = m.take_impact();
    assert(std::fabs(pending - (i1 + i2)) < 1e-15);
    assert(m.take_impact() == 0.0);
    assert(m.thinness() > 1.0);
  }

  // ----------------------------
  // 3) Floor holds under heavy flow
  // ----------------------------
  {
    synthex::LiquidityParams p{};
    p.floor_fraction = 0.05;
    synthex::LiquidityModel m(1'000.0, p);

    for ( int i = 0; i < 50; ++i )
      (void)m.on_fill(Side::Buy, 500);
    assert(m.current() == m.state().floor);
    assert(m.state().floor == 50.0);
    assert(std::isfinite(m.impact_of(Side::Buy, 1'000'000)));
    assert(m.thinness() == 20.0);
  }

  // ----------------------------
  // 4) Recovery: strictly rises toward baseline, never overshoots
  // ----------------------------
  {
    synthex::LiquidityParams p{};
    p.recovery_rate = 0.1;
    synthex::LiquidityModel m(1'000.0, p);
    (void)m.on_fill(Side::Sell, 600);
    assert(m.current() == 400.0);

    double prev = m.current();
    for ( synthex::u64 t = 1; t <= 200; ++t ) {
      m.recover(t);
      if ( prev < m.state().baseline )
        assert(m.current() > prev);
      else
        assert(m.current() == prev);
      assert(m.current() <= m.state().baseline);
      prev = m.current();
    }
    assert(std::fabs(m.current() - 1'000.0) < 1e-6);

    // Ticks at or before the last update are ignored
    (void)m.on_fill(Side::Sell, 100);
    const double after_fill = m.current();
    m.recover(200);
    m.recover(150);
    assert(m.current() == after_fill);

    // A long gap closes at most the full distance
    m.recover(10'000);
    assert(m.current() == 1'000.0);
  }

  return 0;
}
