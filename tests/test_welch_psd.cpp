#include "welch/errors.hpp"
#include "welch/periodogram.hpp"
#include "welch/summary.hpp"
#include "welch/welch_psd.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using welch_test::approx;
using welch_test::approx_rel;

template <typename T>
static std::vector<T> white_noise(size_t n, double sigma, unsigned seed) {
  std::mt19937 rng(seed);
  std::normal_distribution<double> nd(0.0, sigma);
  std::vector<T> x(n);
  for (T& v : x) v = static_cast<T>(nd(rng));
  return x;
}

template <typename T>
static T sum_of(const std::vector<T>& v) {
  double s = 0.0;
  for (T x : v) s += static_cast<double>(x);
  return static_cast<T>(s);
}

static size_t argmax(const std::vector<double>& v) {
  return static_cast<size_t>(std::max_element(v.begin(), v.end()) - v.begin());
}

int main() {
  using namespace welch;

  // Output shape and sign for even/odd, power-of-two and Bluestein lengths.
  {
    const std::vector<double> x = white_noise<double>(1000, 1.0, 1);
    const WindowKind kinds[] = {WindowKind::Rectangular, WindowKind::Hann, WindowKind::Hamming,
                                WindowKind::Blackman};
    for (size_t l : {8u, 9u, 64u, 100u, 101u, 1000u}) {
      for (WindowKind k : kinds) {
        WelchOptions opt;
        opt.segment_length = l;
        opt.window = k;

        const auto sd = make_spectral_density(x, 250.0, opt);
        const std::vector<double> p = sd.periodogram();
        const std::vector<double> f = sd.frequency();
        TEST_CHECK(p.size() == l / 2 + 1);
        TEST_CHECK(f.size() == p.size());
        for (double v : p) TEST_CHECK(v >= 0.0);
        TEST_CHECK(f.front() == 0.0);
        TEST_CHECK(approx(f[1], 250.0 / static_cast<double>(l), 1e-12));

        const auto ps = make_power_spectrum(x, opt);
        const std::vector<double> pp = ps.periodogram();
        const std::vector<double> fp = ps.frequency();
        TEST_CHECK(pp.size() == l / 2 + 1);
        TEST_CHECK(fp.size() == pp.size());
        for (double v : pp) TEST_CHECK(v >= 0.0);
        TEST_CHECK(fp.back() <= 0.5);
        if (l % 2 == 0) TEST_CHECK(approx(fp.back(), 0.5, 1e-12));
      }
    }
  }

  // Recomputing gives identical results; estimate() pairs both sequences.
  {
    const std::vector<double> x = white_noise<double>(20000, 1.0, 2);
    const auto est = make_spectral_density(x, 100.0);
    const std::vector<double> a = est.periodogram();
    const std::vector<double> b = est.periodogram();
    TEST_CHECK(a == b);
    const Spectrum<double> s = est.estimate();
    TEST_CHECK(s.values == a);
    TEST_CHECK(s.freqs == est.frequency());
  }

  // Default segment length heuristic.
  {
    WelchOptions opt;
    TEST_CHECK(default_segment_length(1000, opt) == 400);     // 1000 / 2.5
    TEST_CHECK(default_segment_length(1000000, opt) == 4096); // capped
    TEST_CHECK(default_segment_length(5, opt) == 5);          // clamped to [min(8,N), N]
    TEST_CHECK(default_segment_length(1, opt) == 1);
    TEST_CHECK(default_segment_length(2, opt) == 1); // Hann of length 2 is all zeros
    WelchOptions rect_opt;
    rect_opt.window = WindowKind::Rectangular;
    TEST_CHECK(default_segment_length(2, rect_opt) == 2);
    WelchOptions blackman;
    blackman.window = WindowKind::Blackman;
    TEST_CHECK(default_segment_length(2, blackman) == 1);

    const std::vector<double> two(2, 1.0);
    const auto est_two = make_power_spectrum(two);
    TEST_CHECK(est_two.config().segment_length == 1);
    TEST_CHECK(est_two.config().n_segments == 2);
    const std::vector<double> p_two = est_two.periodogram();
    TEST_CHECK(p_two.size() == 1);
    TEST_CHECK(approx(p_two[0], 1.0, 1e-12));

    const std::vector<double> x = white_noise<double>(1000, 1.0, 3);
    const auto est = make_power_spectrum(x);
    TEST_CHECK(est.config().segment_length == 400);
    TEST_CHECK(est.config().overlap == 200);
    TEST_CHECK(est.config().n_segments == 4);
    TEST_CHECK(est.window().kind() == WindowKind::Hann);

    WelchOptions abs_overlap;
    abs_overlap.overlap_samples = 100;
    TEST_CHECK(default_segment_length(1000, abs_overlap) == 325); // (1000 + 3*100) / 4
    const auto est2 = make_power_spectrum(x, abs_overlap);
    TEST_CHECK(est2.config().overlap == 100);
    TEST_CHECK(est2.config().n_segments == 4);

    WelchOptions more;
    more.n_segments = 8;
    more.max_segment_length = 64;
    const auto est3 = make_power_spectrum(x, more);
    TEST_CHECK(est3.config().segment_length == 64);
    TEST_CHECK(est3.config().n_segments == (1000 - 32) / 32);
  }

  // Boundaries: a single full-length segment, and the extreme overlaps.
  {
    const std::vector<double> x = white_noise<double>(256, 1.0, 4);

    WelchOptions whole;
    whole.segment_length = 256;
    whole.overlap_samples = 0;
    const auto single = make_spectral_density(x, 1.0, whole);
    TEST_CHECK(single.config().n_segments == 1);
    TEST_CHECK(single.periodogram().size() == 129);

    WelchOptions no_overlap;
    no_overlap.segment_length = 50;
    no_overlap.overlap_fraction = 0.0;
    const auto e0 = make_power_spectrum(x, no_overlap);
    TEST_CHECK(e0.config().overlap == 0);
    TEST_CHECK(e0.config().n_segments == 5); // 256 / 50

    WelchOptions max_overlap;
    max_overlap.segment_length = 50;
    max_overlap.overlap_samples = 49;
    const auto e49 = make_power_spectrum(x, max_overlap);
    TEST_CHECK(e49.config().n_segments == 207); // (256 - 49) / 1
    const std::vector<double> p = e49.periodogram();
    TEST_CHECK(p.size() == 26);
    TEST_CHECK(sum_of(p) > 0.0);

    const std::vector<double> one = {3.0};
    const auto tiny = make_power_spectrum(one);
    TEST_CHECK(tiny.config().segment_length == 1);
    TEST_CHECK(tiny.config().overlap == 0);
    const std::vector<double> pt = tiny.periodogram();
    TEST_CHECK(pt.size() == 1);
    TEST_CHECK(approx(pt[0], 9.0, 1e-12));
  }

  // Parseval: the spectral density integrates to the variance for any window.
  {
    const double sigma = 2.0;
    const double fs = 100.0;
    const std::vector<double> x = white_noise<double>(200000, sigma, 5);
    const WindowKind kinds[] = {WindowKind::Rectangular, WindowKind::Hann, WindowKind::Hamming,
                                WindowKind::Blackman};
    for (WindowKind k : kinds) {
      WelchOptions opt;
      opt.window = k;
      const auto est = make_spectral_density(x, fs, opt);
      const double integral = sum_of(est.periodogram()) * est.frequency_resolution();
      TEST_CHECK(approx_rel(integral, sigma * sigma, 0.03));
    }
  }

  // Power spectrum of 10^6 Gaussian samples sums to the variance
  // (rectangular window; other windows after their noise-bandwidth correction).
  {
    const double v = 0.25;
    const std::vector<double> x = white_noise<double>(1000000, std::sqrt(v), 6);

    WelchOptions rect;
    rect.window = WindowKind::Rectangular;
    const auto ps = make_power_spectrum(x, rect);
    TEST_CHECK(ps.config().segment_length == 4096);
    TEST_CHECK(ps.config().n_segments == (1000000 - 2048) / 2048);
    TEST_CHECK(approx_rel(sum_of(ps.periodogram()), v, 0.03));

    const auto hann = make_power_spectrum(x);
    const double l = static_cast<double>(hann.config().segment_length);
    const double enbw = l * hann.window().sum_sq() /
                        (hann.window().sum() * hann.window().sum());
    TEST_CHECK(approx_rel(sum_of(hann.periodogram()) / enbw, v, 0.03));

    const std::vector<float> xf(x.begin(), x.end());
    WelchOptions rect_mt = rect;
    rect_mt.n_threads = 4;
    const auto psf = make_power_spectrum(xf, rect_mt);
    TEST_CHECK(approx_rel(static_cast<double>(sum_of(psf.periodogram())), v, 0.03));
  }

  // On-bin sinusoid, rectangular window: peak = A^2 * L / (2 fs).
  {
    const double fs = 1024.0;
    const double f0 = 128.0;
    const double amp = 2.0;
    const size_t n = 8192;
    const double pi = std::acos(-1.0);
    std::vector<double> x = white_noise<double>(n, 1e-3, 7);
    for (size_t i = 0; i < n; ++i) {
      x[i] += amp * std::sin(2.0 * pi * f0 * static_cast<double>(i) / fs);
    }

    WelchOptions opt;
    opt.segment_length = 1024;
    opt.window = WindowKind::Rectangular;
    const auto est = make_spectral_density(x, fs, opt);
    const std::vector<double> p = est.periodogram();
    const std::vector<double> f = est.frequency();
    const size_t k = argmax(p);
    TEST_CHECK(std::fabs(f[k] - f0) <= est.frequency_resolution());
    TEST_CHECK(approx_rel(p[k], amp * amp * 1024.0 / (2.0 * fs), 0.01));
  }

  // Off-bin sinusoid, default Hann window, non power-of-two sampling setup.
  {
    const double fs = 10e3;
    const double f0 = 1550.0;
    const double amp = 2.0 * std::sqrt(2.0);
    const size_t n = 100000;
    const double pi = std::acos(-1.0);
    std::vector<double> x = white_noise<double>(n, std::sqrt(0.001 * fs / 2.0), 8);
    for (size_t i = 0; i < n; ++i) {
      x[i] += amp * std::sin(2.0 * pi * f0 * static_cast<double>(i) / fs);
    }

    const auto est = make_spectral_density(x, fs);
    const std::vector<double> p = est.periodogram();
    const std::vector<double> f = est.frequency();
    const size_t k = argmax(p);
    TEST_CHECK(std::fabs(f[k] - f0) <= est.frequency_resolution());

    const double s = est.window().sum();
    const double s2 = est.window().sum_sq();
    const double on_bin_peak = amp * amp * s * s / (2.0 * fs * s2);
    TEST_CHECK(p[k] <= 1.05 * on_bin_peak);
    TEST_CHECK(p[k] >= 0.5 * on_bin_peak); // Hann scalloping loss is < 1.5 dB

    // Noise floor well below the tone: 2 * sigma^2 / fs.
    const double floor_expect = 2.0 * (0.001 * fs / 2.0) / fs;
    double floor = 0.0;
    size_t counted = 0;
    for (size_t i = p.size() / 2; i < p.size(); ++i) {
      floor += p[i];
      ++counted;
    }
    floor /= static_cast<double>(counted);
    TEST_CHECK(approx_rel(floor, floor_expect, 0.1));
  }

  // Worker count does not change the estimate beyond rounding.
  {
    const std::vector<double> x = white_noise<double>(50000, 1.0, 9);
    WelchOptions opt;
    opt.segment_length = 500;
    const auto e1 = make_spectral_density(x, 200.0, opt);
    opt.n_threads = 4;
    const auto e4 = make_spectral_density(x, 200.0, opt);
    TEST_CHECK(e4.config().n_threads == std::min<size_t>(4, max_thread_count()));
    const std::vector<double> p1 = e1.periodogram();
    const std::vector<double> p4 = e4.periodogram();
    TEST_CHECK(p1.size() == p4.size());
    for (size_t k = 0; k < p1.size(); ++k) TEST_CHECK(approx_rel(p1[k], p4[k], 1e-9));
    TEST_CHECK(p4 == e4.periodogram());
  }

  // Oversized worker requests are capped at the hardware thread count.
  {
    const std::vector<double> x = white_noise<double>(200000, 1.0, 19);
    WelchOptions opt;
    opt.segment_length = 16;
    opt.overlap_samples = 15;
    opt.n_threads = 100000;
    const auto e = make_power_spectrum(x, opt);
    TEST_CHECK(e.config().n_segments == 199985);
    TEST_CHECK(e.config().n_threads >= 1);
    TEST_CHECK(e.config().n_threads <= max_thread_count());
    const std::vector<double> p = e.periodogram();
    TEST_CHECK(p.size() == 9);
    for (double v : p) TEST_CHECK(std::isfinite(v) && v >= 0.0);
  }

  // Summary.
  {
    const std::vector<double> x = white_noise<double>(10000, 1.0, 10);
    WelchOptions opt;
    opt.segment_length = 1000;
    const auto sd = make_spectral_density(x, 500.0, opt);
    const std::string s = sd.summary();
    TEST_CHECK(s.find("spectral density") != std::string::npos);
    TEST_CHECK(s.find("segment length") != std::string::npos);
    TEST_CHECK(s.find("1000") != std::string::npos);
    TEST_CHECK(s.find("hann") != std::string::npos);
    TEST_CHECK(s.find("bluestein") != std::string::npos);
    TEST_CHECK(s.find("0.5 Hz") != std::string::npos);
    TEST_CHECK(s == format_summary(sd.config()));

    const auto ps = make_power_spectrum(x);
    const std::string s2 = ps.summary();
    TEST_CHECK(s2.find("power spectrum") != std::string::npos);
    TEST_CHECK(s2.find("cycles/sample") != std::string::npos);
    TEST_CHECK(s2.find("sampling frequency") == std::string::npos);
  }

  // Configuration errors are raised at construction.
  {
    const std::vector<double> x = white_noise<double>(100, 1.0, 11);

    WelchOptions too_long;
    too_long.segment_length = 101;
    TEST_THROWS((void)make_spectral_density(x, 10.0, too_long), ConfigError);
    TEST_THROWS((void)make_power_spectrum(x, too_long), ConfigError);

    WelchOptions full_overlap;
    full_overlap.segment_length = 20;
    full_overlap.overlap_samples = 20;
    TEST_THROWS((void)make_power_spectrum(x, full_overlap), ConfigError);

    WelchOptions bad_fraction;
    bad_fraction.overlap_fraction = 1.0;
    TEST_THROWS((void)make_power_spectrum(x, bad_fraction), ConfigError);
    bad_fraction.overlap_fraction = -0.1;
    TEST_THROWS((void)make_power_spectrum(x, bad_fraction), ConfigError);

    TEST_THROWS((void)make_spectral_density(x, 0.0), ConfigError);
    TEST_THROWS((void)make_spectral_density(x, -1.0), ConfigError);
    TEST_THROWS((void)make_spectral_density(x, std::nan("")), ConfigError);

    WelchOptions degenerate;
    degenerate.segment_length = 2;
    degenerate.window = WindowKind::Hann;
    TEST_THROWS((void)make_power_spectrum(x, degenerate), ConfigError);
    // Errors raised while building the window carry the factory name too.
    std::string degenerate_msg;
    try {
      (void)make_power_spectrum(x, degenerate);
    } catch (const ConfigError& e) {
      degenerate_msg = e.what();
    }
    TEST_CHECK(degenerate_msg.rfind("make_power_spectrum: ", 0) == 0);
    TEST_CHECK(degenerate_msg.find("all zeros") != std::string::npos);

    WelchOptions zero_k;
    zero_k.n_segments = 0;
    TEST_THROWS((void)make_power_spectrum(x, zero_k), ConfigError);

    const std::vector<double> empty;
    TEST_THROWS((void)make_power_spectrum(empty), InsufficientDataError);
    TEST_THROWS((void)make_spectral_density(empty, 1.0), InsufficientDataError);

    // Both error kinds share std::runtime_error as their base.
    bool threw = false;
    try {
      (void)make_power_spectrum(x, too_long);
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("make_power_spectrum") != std::string::npos;
    }
    TEST_CHECK(threw);
  }

  std::cout << "test_welch_psd OK\n";
  return 0;
}
