// ==============================================================================
// Layer 3: System Tests - Spectral Noise Synthesizer
// ==============================================================================
// End-to-end checks of the synthesis pipeline. Spectral shape is verified by
// running the output back through a forward FFT: with unit-magnitude random
// phase bins, |FFT(x)[k]| equals the normalization gain times the sampled
// response at bin k.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <shapenoise/dsp/core/random.h>
#include <shapenoise/dsp/primitives/fft.h>
#include <shapenoise/dsp/systems/spectral_noise_synthesizer.h>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

using namespace Shapenoise::DSP;
using Catch::Approx;

namespace {

NoiseRequest makeRequest(std::vector<double> frequencies,
                         std::vector<double> responses,
                         BoundaryPolicy lower,
                         BoundaryPolicy upper,
                         double duration = 1.0) {
    NoiseRequest request;
    request.frequencies = std::move(frequencies);
    request.responses = std::move(responses);
    request.nyquist = 8000.0;
    request.duration = duration;
    request.lowerBoundary = lower;
    request.upperBoundary = upper;
    return request;
}

/// Positive-frequency magnitude spectrum of a real signal (n/2 + 1 bins)
std::vector<float> magnitudeSpectrum(const std::vector<float>& samples) {
    const size_t n = samples.size();
    std::vector<Complex> in(n);
    for (size_t t = 0; t < n; ++t) {
        in[t] = {samples[t], 0.0f};
    }
    std::vector<Complex> out(n);

    FFT fft;
    if (!fft.prepare(n)) return {};
    fft.forward(in.data(), out.data());

    std::vector<float> mags(n / 2 + 1);
    for (size_t k = 0; k < mags.size(); ++k) {
        mags[k] = out[k].magnitude();
    }
    return mags;
}

float peakOf(const std::vector<float>& samples) {
    float peak = 0.0f;
    for (float s : samples) {
        peak = std::max(peak, std::abs(s));
    }
    return peak;
}

} // namespace

// ==============================================================================
// Rate Resolution
// ==============================================================================

TEST_CASE("resolveRates derives the missing rate", "[synthesizer][rates]") {
    SECTION("from nyquist") {
        NoiseRequest request;
        request.nyquist = 8000.0;
        request.duration = 1.0;
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE(rates);
        CHECK(rates.value.nyquist == 8000.0);
        CHECK(rates.value.sampleRate == 16000.0);
        CHECK(rates.value.numBins == 8001);
        CHECK(rates.value.numSamples == 16000);
    }

    SECTION("from sampling rate") {
        NoiseRequest request;
        request.sampleRate = 44100.0;
        request.duration = 1.0;
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE(rates);
        CHECK(rates.value.nyquist == 22050.0);
        CHECK(rates.value.numBins == 22051);
        CHECK(rates.value.numSamples == 44100);
    }

    SECTION("both given and consistent") {
        NoiseRequest request;
        request.nyquist = 8000.0;
        request.sampleRate = 16000.0;
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE(rates);
        // Default duration of 10 s
        CHECK(rates.value.numBins == 80001);
        CHECK(rates.value.numSamples == 160000);
    }
}

TEST_CASE("resolveRates configuration errors", "[synthesizer][rates][error]") {
    NoiseRequest request;
    request.duration = 1.0;

    SECTION("neither rate given") {
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE_FALSE(rates);
        CHECK(rates.error == SynthesisError::ConfigError);
    }

    SECTION("inconsistent rates") {
        request.nyquist = 8000.0;
        request.sampleRate = 44100.0;
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE_FALSE(rates);
        CHECK(rates.error == SynthesisError::ConfigError);
    }

    SECTION("non-positive nyquist") {
        request.nyquist = -8000.0;
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE_FALSE(rates);
        CHECK(rates.error == SynthesisError::ConfigError);
    }

    SECTION("non-positive duration") {
        request.nyquist = 8000.0;
        request.duration = 0.0;
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE_FALSE(rates);
        CHECK(rates.error == SynthesisError::ConfigError);
    }

    SECTION("duration * nyquist is not a whole number") {
        request.nyquist = 8000.0;
        request.duration = 0.00015;  // 1.2 intervals
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE_FALSE(rates);
        CHECK(rates.error == SynthesisError::ConfigError);
    }

    SECTION("fractional sampling rate") {
        request.sampleRate = 16000.5;
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE_FALSE(rates);
        CHECK(rates.error == SynthesisError::ConfigError);
    }

    SECTION("sampling rate whose WAV byte rate would overflow") {
        request.sampleRate = 2000000000.0;
        request.duration = 0.001;
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE_FALSE(rates);
        CHECK(rates.error == SynthesisError::ConfigError);
    }

    SECTION("highest sampling rate a WAV header can carry") {
        request.sampleRate = static_cast<double>(kMaxSampleRate) + 1.0;
        request.duration = 1.0;
        auto rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE_FALSE(rates);
        CHECK(rates.error == SynthesisError::ConfigError);

        request.sampleRate = 1073741822.0;
        request.duration = 1.0;
        rates = SpectralNoiseSynthesizer::resolveRates(request);
        REQUIRE(rates);
        CHECK(rates.value.sampleRate == 1073741822.0);
    }
}

TEST_CASE("resolveRates rejects control frequencies above nyquist", "[synthesizer][rates][error]") {
    NoiseRequest request = makeRequest({1000.0, 9000.0}, {1.0, 1.0},
                                       BoundaryPolicy::Linear, BoundaryPolicy::Linear);
    auto rates = SpectralNoiseSynthesizer::resolveRates(request);
    REQUIRE_FALSE(rates);
    CHECK(rates.error == SynthesisError::DomainError);
}

// ==============================================================================
// Response Curve Construction
// ==============================================================================

TEST_CASE("buildResponseCurve applies boundary policies", "[synthesizer][curve]") {
    SECTION("Zero below, Linear above") {
        auto curve = SpectralNoiseSynthesizer::buildResponseCurve(
            makeRequest({2000.0}, {1.0}, BoundaryPolicy::Zero, BoundaryPolicy::Linear), 8000.0);
        REQUIRE(curve);
        CHECK(curve.value.evaluate(0.0).value == 0.0);
        CHECK(curve.value.evaluate(1999.0).value == 0.0);
        CHECK(curve.value.evaluate(2000.0).value == 1.0);
        CHECK(curve.value.evaluate(5000.0).value == Approx(0.5));
        CHECK(curve.value.evaluate(8000.0).value == 0.0);
    }

    SECTION("Zero on both sides cuts off eps outside the band") {
        auto curve = SpectralNoiseSynthesizer::buildResponseCurve(
            makeRequest({2000.0, 6000.0}, {1.0, 1.0}, BoundaryPolicy::Zero, BoundaryPolicy::Zero),
            8000.0);
        REQUIRE(curve);
        CHECK(curve.value.evaluate(2000.0 - kDefaultBoundaryEpsilon).value == 0.0);
        CHECK(curve.value.evaluate(6000.0 + kDefaultBoundaryEpsilon).value == 0.0);
        CHECK(curve.value.evaluate(2000.0).value == 1.0);
        CHECK(curve.value.evaluate(6000.0).value == 1.0);
        CHECK(curve.value.evaluate(1000.0).value == 0.0);
        CHECK(curve.value.evaluate(7000.0).value == 0.0);
    }

    SECTION("Linear below ramps up from 0 Hz to the first control point") {
        auto curve = SpectralNoiseSynthesizer::buildResponseCurve(
            makeRequest({2000.0}, {1.0}, BoundaryPolicy::Linear, BoundaryPolicy::Flat), 8000.0);
        REQUIRE(curve);
        CHECK(curve.value.evaluate(0.0).value == 0.0);
        double previous = curve.value.evaluate(0.0).value;
        for (int step = 1; step <= 20; ++step) {
            const double f = 100.0 * step;
            const double r = curve.value.evaluate(f).value;
            CHECK(r > previous);
            CHECK(r == Approx(f / 2000.0));
            previous = r;
        }
        CHECK(previous == 1.0);
    }

    SECTION("Flat on both sides") {
        auto curve = SpectralNoiseSynthesizer::buildResponseCurve(
            makeRequest({3000.0, 5000.0}, {0.2, 0.6}, BoundaryPolicy::Flat, BoundaryPolicy::Flat),
            8000.0);
        REQUIRE(curve);
        CHECK(curve.value.evaluate(0.0).value == 0.2);
        CHECK(curve.value.evaluate(1000.0).value == 0.2);
        CHECK(curve.value.evaluate(4000.0).value == Approx(0.4));
        CHECK(curve.value.evaluate(8000.0).value == 0.6);
    }

    SECTION("unsorted control points") {
        auto curve = SpectralNoiseSynthesizer::buildResponseCurve(
            makeRequest({6000.0, 2000.0, 4000.0}, {0.0, 0.0, 1.0},
                        BoundaryPolicy::Linear, BoundaryPolicy::Linear), 8000.0);
        REQUIRE(curve);
        CHECK(curve.value.evaluate(3000.0).value == Approx(0.5));
        CHECK(curve.value.evaluate(1000.0).value == 0.0);
    }

    SECTION("duplicate control frequencies") {
        auto curve = SpectralNoiseSynthesizer::buildResponseCurve(
            makeRequest({2000.0, 2000.0}, {1.0, 0.5},
                        BoundaryPolicy::Linear, BoundaryPolicy::Linear), 8000.0);
        REQUIRE_FALSE(curve);
        CHECK(curve.error == SynthesisError::DomainError);
    }
}

TEST_CASE("buildResponseCurve validates policies even when unused", "[synthesizer][curve][error]") {
    // The point sits on 0 Hz, so the lower policy is never applied
    auto curve = SpectralNoiseSynthesizer::buildResponseCurve(
        makeRequest({0.0}, {1.0}, static_cast<BoundaryPolicy>(5), BoundaryPolicy::Linear), 8000.0);
    REQUIRE_FALSE(curve);
    CHECK(curve.error == SynthesisError::InvalidPolicy);
}

// ==============================================================================
// Rendering
// ==============================================================================

TEST_CASE("render produces duration * sampleRate samples at peak 0.8", "[synthesizer][render]") {
    SpectralNoiseSynthesizer synth;
    Xorshift32 rng(2024);

    SECTION("nyquist 8000, 1 s") {
        auto signal = synth.render(
            makeRequest({4000.0}, {1.0}, BoundaryPolicy::Flat, BoundaryPolicy::Flat), rng);
        REQUIRE(signal);
        CHECK(signal.value.samples.size() == 16000);
        CHECK(signal.value.sampleRate == 16000.0);
        CHECK(peakOf(signal.value.samples) == Approx(0.8f).margin(1e-6f));
    }

    SECTION("sampling rate 44100, 0.5 s") {
        NoiseRequest request;
        request.frequencies = {1000.0, 10000.0};
        request.responses = {1.0, 0.5};
        request.sampleRate = 44100.0;
        request.duration = 0.5;
        auto signal = synth.render(request, rng);
        REQUIRE(signal);
        CHECK(signal.value.samples.size() == 22050);
        CHECK(peakOf(signal.value.samples) == Approx(0.8f).margin(1e-6f));
    }

    SECTION("custom peak level") {
        NoiseRequest request = makeRequest({4000.0}, {1.0},
                                           BoundaryPolicy::Linear, BoundaryPolicy::Linear);
        request.peakLevel = 0.5f;
        auto signal = synth.render(request, rng);
        REQUIRE(signal);
        CHECK(peakOf(signal.value.samples) == Approx(0.5f).margin(1e-6f));
    }
}

TEST_CASE("render full-spectrum white noise at the default duration", "[synthesizer][render]") {
    NoiseRequest request;
    request.frequencies = {4000.0};
    request.responses = {1.0};
    request.sampleRate = 16000.0;
    request.lowerBoundary = BoundaryPolicy::Flat;
    request.upperBoundary = BoundaryPolicy::Flat;

    SpectralNoiseSynthesizer synth;
    Xorshift32 rng(1);
    auto signal = synth.render(request, rng);
    REQUIRE(signal);
    CHECK(signal.value.samples.size() == 160000);
    CHECK(synth.rates().numBins == 80001);
    CHECK(peakOf(signal.value.samples) == Approx(0.8f).margin(1e-6f));

    const auto& mags = synth.sampledMagnitudes();
    REQUIRE(mags.size() == 80001);
    CHECK(std::all_of(mags.begin(), mags.end(), [](float m) { return m == 1.0f; }));
}

TEST_CASE("render zero-bounded band has no energy outside the band", "[synthesizer][spectrum]") {
    SpectralNoiseSynthesizer synth;
    Xorshift32 rng(99);
    auto signal = synth.render(
        makeRequest({2000.0, 6000.0}, {1.0, 1.0}, BoundaryPolicy::Zero, BoundaryPolicy::Zero), rng);
    REQUIRE(signal);

    // 1 s at 16 kHz: bin k of the 16000-point FFT is k Hz
    const auto mags = magnitudeSpectrum(signal.value.samples);
    REQUIRE(mags.size() == 8001);

    float minInBand = mags[2000];
    for (size_t k = 2000; k <= 6000; ++k) {
        minInBand = std::min(minInBand, mags[k]);
    }
    REQUIRE(minInBand > 0.0f);

    float maxOutOfBand = 0.0f;
    for (size_t k = 0; k < 2000; ++k) {
        maxOutOfBand = std::max(maxOutOfBand, mags[k]);
    }
    for (size_t k = 6001; k <= 8000; ++k) {
        maxOutOfBand = std::max(maxOutOfBand, mags[k]);
    }
    CHECK(maxOutOfBand < 1e-3f * minInBand);

    // In-band bins all carry the same magnitude
    CHECK(mags[3000] == Approx(minInBand).epsilon(1e-3));
    CHECK(mags[6000] == Approx(minInBand).epsilon(1e-3));
}

TEST_CASE("render triangular response shapes the spectrum", "[synthesizer][spectrum]") {
    SpectralNoiseSynthesizer synth;
    Xorshift32 rng(5);
    auto signal = synth.render(
        makeRequest({4000.0}, {1.0}, BoundaryPolicy::Linear, BoundaryPolicy::Linear), rng);
    REQUIRE(signal);

    const auto mags = magnitudeSpectrum(signal.value.samples);
    REQUIRE(mags.size() == 8001);

    const float peakBin = mags[4000];
    REQUIRE(peakBin > 0.0f);
    CHECK(mags[2000] / peakBin == Approx(0.5f).margin(1e-3f));
    CHECK(mags[3000] / peakBin == Approx(0.75f).margin(1e-3f));
    CHECK(mags[7000] / peakBin == Approx(0.25f).margin(1e-3f));
    CHECK(mags[0] / peakBin == Approx(0.0f).margin(1e-3f));
    CHECK(mags[8000] / peakBin == Approx(0.0f).margin(1e-3f));
}

TEST_CASE("render impulse-like response is a single spectral line", "[synthesizer][spectrum]") {
    SpectralNoiseSynthesizer synth;
    Xorshift32 rng(11);
    auto signal = synth.render(
        makeRequest({4000.0}, {1.0}, BoundaryPolicy::Zero, BoundaryPolicy::Zero), rng);
    REQUIRE(signal);

    // A 4000 Hz tone at 16 kHz repeats every 4 samples
    const auto& x = signal.value.samples;
    for (size_t t = 0; t + 4 < x.size(); ++t) {
        REQUIRE(x[t + 4] == Approx(x[t]).margin(1e-4f));
    }
}

TEST_CASE("render is reproducible for a given seed", "[synthesizer][render]") {
    const NoiseRequest request = makeRequest({2000.0, 6000.0}, {1.0, 1.0},
                                             BoundaryPolicy::Linear, BoundaryPolicy::Linear);
    SpectralNoiseSynthesizer synthA;
    SpectralNoiseSynthesizer synthB;
    Xorshift32 rngA(31337);
    Xorshift32 rngB(31337);

    auto a = synthA.render(request, rngA);
    auto b = synthB.render(request, rngB);
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(a.value.samples == b.value.samples);

    SECTION("the generator advances, so the next call differs") {
        auto c = synthA.render(request, rngA);
        REQUIRE(c);
        CHECK(c.value.samples != a.value.samples);
    }
}

TEST_CASE("synthesize keeps the imaginary residue negligible", "[synthesizer][render]") {
    SpectralNoiseSynthesizer synth;
    Xorshift32 rng(8);
    auto signal = synth.synthesize(
        makeRequest({4000.0}, {1.0}, BoundaryPolicy::Flat, BoundaryPolicy::Flat), rng);
    REQUIRE(signal);
    const float rawPeak = peakOf(signal.value.samples);
    REQUIRE(rawPeak > 0.0f);
    // DC and nyquist bins carry random phase, so some residue is expected,
    // bounded by their magnitude / N
    CHECK(synth.imaginaryResidue() <= 2.0f / 16000.0f + 1e-5f);
}

TEST_CASE("render error paths", "[synthesizer][render][error]") {
    SpectralNoiseSynthesizer synth;
    Xorshift32 rng(1);

    SECTION("all-zero response cannot be normalized") {
        auto signal = synth.render(
            makeRequest({4000.0}, {0.0}, BoundaryPolicy::Flat, BoundaryPolicy::Flat), rng);
        REQUIRE_FALSE(signal);
        CHECK(signal.error == SynthesisError::SilentSignal);
    }

    SECTION("invalid policy") {
        auto signal = synth.render(
            makeRequest({4000.0}, {1.0}, BoundaryPolicy::Linear, static_cast<BoundaryPolicy>(4)),
            rng);
        REQUIRE_FALSE(signal);
        CHECK(signal.error == SynthesisError::InvalidPolicy);
    }

    SECTION("mismatched control sequences") {
        auto signal = synth.render(
            makeRequest({1000.0, 2000.0}, {1.0}, BoundaryPolicy::Linear, BoundaryPolicy::Linear),
            rng);
        REQUIRE_FALSE(signal);
        CHECK(signal.error == SynthesisError::ConfigError);
    }

    SECTION("negative response") {
        auto signal = synth.render(
            makeRequest({1000.0}, {-1.0}, BoundaryPolicy::Linear, BoundaryPolicy::Linear), rng);
        REQUIRE_FALSE(signal);
        CHECK(signal.error == SynthesisError::DomainError);
    }

    SECTION("non-positive peak level") {
        NoiseRequest request = makeRequest({1000.0}, {1.0},
                                           BoundaryPolicy::Linear, BoundaryPolicy::Linear);
        request.peakLevel = 0.0f;
        auto signal = synth.render(request, rng);
        REQUIRE_FALSE(signal);
        CHECK(signal.error == SynthesisError::ConfigError);
    }

    SECTION("failures leave the generator untouched") {
        const uint32_t before = rng.state();
        auto signal = synth.render(
            makeRequest({9000.0}, {1.0}, BoundaryPolicy::Linear, BoundaryPolicy::Linear), rng);
        REQUIRE_FALSE(signal);
        CHECK(rng.state() == before);
    }
}

// ==============================================================================
// Normalization and Time Axis
// ==============================================================================

TEST_CASE("normalizePeak scales to the requested peak", "[synthesizer][normalize]") {
    std::vector<float> samples = {0.1f, -0.4f, 0.2f};
    REQUIRE(normalizePeak(samples, 0.8f));
    CHECK(samples[0] == Approx(0.2f));
    CHECK(samples[1] == Approx(-0.8f));
    CHECK(samples[2] == Approx(0.4f));

    std::vector<float> silent(16, 0.0f);
    const Status status = normalizePeak(silent, 0.8f);
    REQUIRE_FALSE(status);
    CHECK(status.error == SynthesisError::SilentSignal);
}

TEST_CASE("SynthesizedSignal time axis", "[synthesizer][time]") {
    SynthesizedSignal signal;
    signal.samples.assign(16000, 0.0f);
    signal.sampleRate = 16000.0;

    const auto times = signal.timeAxis();
    REQUIRE(times.size() == 16000);
    CHECK(times[0] == 0.0);
    CHECK(times[1] == Approx(1.0 / 16000.0));
    CHECK(times.back() == Approx(15999.0 / 16000.0));
    CHECK(signal.timeAt(8000) == Approx(0.5));
}
