#include "welch/errors.hpp"
#include "welch/sample_reader.hpp"
#include "welch/utils.hpp"
#include "welch/version.hpp"
#include "welch/welch_psd.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace welch;

namespace {

struct Args {
  std::string input_path;
  size_t column{0};
  bool column_given{false};

  bool demo{false};
  size_t demo_n{100000};
  double demo_freq_hz{1550.0};
  double demo_amp{2.0 * std::sqrt(2.0)};
  double demo_noise_sigma{1.0};
  unsigned seed{12345};

  bool power_spectrum{false};
  double fs_hz{0.0};

  WelchOptions welch;
  bool single_precision{false};

  std::string output_path;
  bool quiet{false};
};

static void print_help() {
  std::cout
    << "welch_psd_cli\n\n"
    << "Estimate the spectral density (or power spectrum) of a single real-valued\n"
    << "signal with Welch's averaged, modified periodogram method.\n\n"
    << "Usage:\n"
    << "  welch_psd_cli --input samples.csv --fs 250\n"
    << "  welch_psd_cli --input samples.txt --power-spectrum --window rectangular\n"
    << "  welch_psd_cli --demo --fs 10000 --output psd.csv\n\n"
    << "Input:\n"
    << "  --input PATH           One sample per row (CSV/TXT; '#' comments and a header row are skipped)\n"
    << "  --column N             0-based CSV column holding the samples (default: 0)\n"
    << "                         Without --column, a row like '0,5' is read as one decimal-comma sample\n"
    << "  --demo                 Synthesize a sinusoid in Gaussian noise instead of reading a file\n"
    << "  --demo-n N             Demo signal length (default: 100000)\n"
    << "  --demo-freq HZ         Demo sinusoid frequency (default: 1550; cycles/sample with --power-spectrum)\n"
    << "  --demo-amp A           Demo sinusoid amplitude (default: 2*sqrt(2))\n"
    << "  --demo-noise SIGMA     Demo noise standard deviation (default: 1)\n"
    << "  --seed N               Demo random seed (default: 12345)\n\n"
    << "Estimator:\n"
    << "  --fs HZ                Sampling frequency (required for the spectral density)\n"
    << "  --power-spectrum       Power spectrum on a normalized frequency axis (no --fs needed)\n"
    << "  --nperseg N            Segment length (default: derived from the signal length)\n"
    << "  --overlap F            Overlap fraction in [0,1) (default: 0.5)\n"
    << "  --noverlap N           Overlap in samples (overrides --overlap)\n"
    << "  --window NAME          rectangular|hann|hamming|blackman (default: hann)\n"
    << "  --nsegments K          Target segment count for the default segment length (default: 4)\n"
    << "  --max-nperseg N        Cap for the default segment length (default: 4096)\n"
    << "  --threads N            Worker threads (0 => all cores; capped at the core count; default: 1)\n"
    << "  --float                Compute in single precision\n\n"
    << "Output:\n"
    << "  --output PATH          Write frequency,value CSV to PATH (default: stdout)\n"
    << "  --quiet                Do not print the estimator summary to stderr\n"
    << "  --version              Print the version and exit\n"
    << "  -h, --help             Show this help\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << version_string() << "\n";
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
    } else if (arg == "--column" && i + 1 < argc) {
      a.column = to_size(argv[++i]);
      a.column_given = true;
    } else if (arg == "--demo") {
      a.demo = true;
    } else if (arg == "--demo-n" && i + 1 < argc) {
      a.demo_n = to_size(argv[++i]);
    } else if (arg == "--demo-freq" && i + 1 < argc) {
      a.demo_freq_hz = to_double(argv[++i]);
    } else if (arg == "--demo-amp" && i + 1 < argc) {
      a.demo_amp = to_double(argv[++i]);
    } else if (arg == "--demo-noise" && i + 1 < argc) {
      a.demo_noise_sigma = to_double(argv[++i]);
    } else if (arg == "--seed" && i + 1 < argc) {
      a.seed = static_cast<unsigned>(to_size(argv[++i]));
    } else if (arg == "--fs" && i + 1 < argc) {
      a.fs_hz = to_double(argv[++i]);
    } else if (arg == "--power-spectrum") {
      a.power_spectrum = true;
    } else if (arg == "--nperseg" && i + 1 < argc) {
      a.welch.segment_length = to_size(argv[++i]);
    } else if (arg == "--overlap" && i + 1 < argc) {
      a.welch.overlap_fraction = to_double(argv[++i]);
    } else if (arg == "--noverlap" && i + 1 < argc) {
      a.welch.overlap_samples = to_size(argv[++i]);
    } else if (arg == "--window" && i + 1 < argc) {
      a.welch.window = parse_window_kind(argv[++i]);
    } else if (arg == "--nsegments" && i + 1 < argc) {
      a.welch.n_segments = to_size(argv[++i]);
    } else if (arg == "--max-nperseg" && i + 1 < argc) {
      a.welch.max_segment_length = to_size(argv[++i]);
    } else if (arg == "--threads" && i + 1 < argc) {
      a.welch.n_threads = to_size(argv[++i]);
    } else if (arg == "--float") {
      a.single_precision = true;
    } else if (arg == "--output" && i + 1 < argc) {
      a.output_path = argv[++i];
    } else if (arg == "--quiet") {
      a.quiet = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  return a;
}

static std::vector<double> demo_signal(const Args& a, double fs_hz) {
  std::vector<double> x(a.demo_n, 0.0);
  std::mt19937 rng(a.seed);
  std::normal_distribution<double> noise(0.0, a.demo_noise_sigma);
  const double pi = std::acos(-1.0);
  for (size_t i = 0; i < x.size(); ++i) {
    const double t = static_cast<double>(i) / fs_hz;
    x[i] = a.demo_amp * std::sin(2.0 * pi * a.demo_freq_hz * t) + noise(rng);
  }
  return x;
}

template <typename T>
static Spectrum<T> run_estimator(const std::vector<T>& x, const Args& a) {
  const WelchEstimator<T> est = a.power_spectrum
                                    ? make_power_spectrum(x, a.welch)
                                    : make_spectral_density(x, static_cast<T>(a.fs_hz), a.welch);
  if (!a.quiet) std::cerr << est.summary() << "\n";

  const auto t0 = std::chrono::steady_clock::now();
  Spectrum<T> s = est.estimate();
  const auto t1 = std::chrono::steady_clock::now();
  if (!a.quiet) {
    const double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    std::cerr << "Estimated in " << std::fixed << std::setprecision(1) << ms << " ms\n";
    std::cerr.unsetf(std::ios::floatfield);
  }
  return s;
}

template <typename T>
static void write_csv(std::ostream& os, const Spectrum<T>& s, bool power_spectrum) {
  os << (power_spectrum ? "frequency_cycles_per_sample,power" : "frequency_hz,psd") << "\n";
  os << std::setprecision(10);
  for (size_t k = 0; k < s.values.size(); ++k) {
    os << s.freqs[k] << "," << s.values[k] << "\n";
  }
}

template <typename T>
static void run(const std::vector<double>& samples, const Args& a) {
  std::vector<T> x(samples.begin(), samples.end());
  const Spectrum<T> s = run_estimator(x, a);

  if (a.output_path.empty()) {
    write_csv(std::cout, s, a.power_spectrum);
    return;
  }
  std::ofstream out(a.output_path, std::ios::binary);
  if (!out) throw std::runtime_error("Failed to open output: " + a.output_path);
  write_csv(out, s, a.power_spectrum);
  out.flush();
  if (!out) throw std::runtime_error("Failed to write output: " + a.output_path);
  if (!a.quiet) std::cerr << "Wrote " << s.values.size() << " bins to " << a.output_path << "\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (!args.demo && args.input_path.empty()) {
      print_help();
      return 1;
    }
    if (!args.power_spectrum && !(args.fs_hz > 0.0)) {
      throw std::runtime_error("--fs is required for the spectral density (or pass --power-spectrum)");
    }

    std::vector<double> samples;
    if (args.demo) {
      samples = demo_signal(args, args.power_spectrum ? 1.0 : args.fs_hz);
    } else {
      SampleReadOptions ropt;
      ropt.column = args.column;
      ropt.decimal_comma_rows = !args.column_given;
      samples = read_samples_file(args.input_path, ropt);
    }

    if (args.single_precision) {
      run<float>(samples, args);
    } else {
      run<double>(samples, args);
    }
    return 0;

  } catch (const ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 2;
  } catch (const InsufficientDataError& e) {
    std::cerr << "Insufficient data: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    std::cerr << "Run with --help for usage.\n";
    return 1;
  }
}
