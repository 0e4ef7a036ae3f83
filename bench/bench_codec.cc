#include "benchmark/benchmark.h"

#include "ieee.h"
#include "join_split.h"

#include <cstdint>
#include <cstdio>

#include <algorithm>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

//==================================================================================================
//
//==================================================================================================

class JenkinsRandom
{
    // A small noncryptographic PRNG
    // http://burtleburtle.net/bob/rand/smallprng.html

    uint32_t a;
    uint32_t b;
    uint32_t c;
    uint32_t d;

    static uint32_t Rotate(uint32_t value, int n) {
        return (value << n) | (value >> (32 - n));
    }

    uint32_t Gen() {
        const uint32_t e = a - Rotate(b, 27);
        a = b ^ Rotate(c, 17);
        b = c + d;
        c = d + e;
        d = e + a;
        return d;
    }

public:
    using result_type = uint32_t;

    static constexpr uint32_t min() { return 0; }
    static constexpr uint32_t max() { return UINT32_MAX; }

    explicit JenkinsRandom(uint32_t seed = 0) {
        a = 0xF1EA5EED;
        b = seed;
        c = seed;
        d = seed;
        for (int i = 0; i < 20; ++i) {
            static_cast<void>(Gen());
        }
    }

    uint32_t operator()() { return Gen(); }
};

static JenkinsRandom rng;

static constexpr int NumValues = 1 << 13;

static void Configure(benchmark::internal::Benchmark* bench)
{
    bench->ComputeStatistics("min", [](const std::vector<double>& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

//==================================================================================================
// Shortest decimal
//==================================================================================================

template <typename Float>
static void BenchFormat(benchmark::State& state, const std::vector<Float>& numbers)
{
    int index = 0;

    uint64_t sum = 0;
    for (auto _ : state)
    {
        char buffer[numtext::MaxFormattedLength];
        numtext::Format(buffer, numbers[static_cast<size_t>(index)]);
        sum += static_cast<unsigned char>(buffer[0]);
        index = (index + 1) & (NumValues - 1);
    }

    benchmark::DoNotOptimize(sum);
}

template <typename Float>
static void BenchParse(benchmark::State& state, const std::vector<std::string>& strings)
{
    int index = 0;
    for (auto _ : state)
    {
        const std::string& str = strings[static_cast<size_t>(index)];
        Float flt = 0;
        const auto res = numtext::ParseFloat(str.data(), str.data() + str.size(), flt);
        benchmark::DoNotOptimize(res);
        benchmark::DoNotOptimize(flt);
        index = (index + 1) & (NumValues - 1);
    }
}

template <typename Float>
static std::vector<std::string> FormatAll(const std::vector<Float>& numbers)
{
    std::vector<std::string> strings;
    strings.reserve(numbers.size());
    for (const Float f : numbers)
        strings.push_back(numtext::ToString(f));
    return strings;
}

template <typename Float>
static void RegisterFloat(const std::string& name, const std::vector<Float>& numbers)
{
    const char* float_name = sizeof(Float) == 4 ? "single" : "double";

    Configure(benchmark::RegisterBenchmark((std::string("Format ") + float_name + " - " + name).c_str(), BenchFormat<Float>, numbers));
    Configure(benchmark::RegisterBenchmark((std::string("Parse ") + float_name + " - " + name).c_str(), BenchParse<Float>, FormatAll(numbers)));
}

static void Register_RandomBits()
{
    std::vector<double> doubles(NumValues);
    std::uniform_int_distribution<uint64_t> gen64(1, 0x7FF0000000000000ull - 1);
    std::generate(doubles.begin(), doubles.end(), [&] { return numtext::ReinterpretBits<double>(gen64(rng)); });
    RegisterFloat("Random-bits", doubles);

    std::vector<float> singles(NumValues);
    std::uniform_int_distribution<uint32_t> gen32(1, 0x7F800000u - 1);
    std::generate(singles.begin(), singles.end(), [&] { return numtext::ReinterpretBits<float>(gen32(rng)); });
    RegisterFloat("Random-bits", singles);
}

template <typename Float>
static void Register_Uniform(Float low, Float high)
{
    std::vector<Float> numbers(NumValues);

    std::uniform_real_distribution<Float> gen(low, high);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(rng); });

    char name[64];
    std::snprintf(name, sizeof(name), "Uniform %.1g/%.1g", static_cast<double>(low), static_cast<double>(high));
    RegisterFloat(name, numbers);
}

// Short decimals: n / 10^digits in [1, 2)
static void Register_ShortDigits(int digits)
{
    std::vector<double> numbers(NumValues);

    double scale = 1;
    for (int i = 0; i < digits; ++i)
        scale *= 10;

    std::uniform_real_distribution<double> gen(1, 2);
    std::generate(numbers.begin(), numbers.end(), [&] { return static_cast<double>(static_cast<int64_t>(gen(rng) * scale)) / scale; });

    RegisterFloat("1." + std::to_string(digits) + "-digits", numbers);
}

//==================================================================================================
// Integers and bits
//==================================================================================================

static void BenchEncodeSigned(benchmark::State& state, const std::vector<int64_t>& numbers, const numtext::Alphabet& alphabet)
{
    int index = 0;
    for (auto _ : state)
    {
        char buffer[80];
        char* const end = numtext::EncodeSigned(buffer, numbers[static_cast<size_t>(index)], alphabet);
        benchmark::DoNotOptimize(end);
        index = (index + 1) & (NumValues - 1);
    }
}

static void BenchDecodeSigned(benchmark::State& state, const std::vector<std::string>& strings, const numtext::Alphabet& alphabet)
{
    int index = 0;
    for (auto _ : state)
    {
        const std::string& str = strings[static_cast<size_t>(index)];
        int64_t value = 0;
        const auto res = numtext::DecodeSigned(str.data(), str.data() + str.size(), alphabet, value);
        benchmark::DoNotOptimize(res);
        benchmark::DoNotOptimize(value);
        index = (index + 1) & (NumValues - 1);
    }
}

static void BenchEncodeBits(benchmark::State& state, const std::vector<double>& numbers, const numtext::Alphabet& alphabet)
{
    int index = 0;
    for (auto _ : state)
    {
        char buffer[80];
        char* const end = numtext::EncodeBits(buffer, numbers[static_cast<size_t>(index)], alphabet);
        benchmark::DoNotOptimize(end);
        index = (index + 1) & (NumValues - 1);
    }
}

static void Register_Integers()
{
    std::vector<int64_t> numbers(NumValues);
    std::uniform_int_distribution<int64_t> gen(INT64_MIN, INT64_MAX);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(rng); });

    std::vector<double> doubles(NumValues);
    std::generate(doubles.begin(), doubles.end(), [&] { return numtext::ReinterpretBits<double>(static_cast<uint64_t>(gen(rng))); });

    const std::pair<const char*, const numtext::Alphabet*> alphabets[] = {
        {"Base10", &numtext::Base10()},
        {"Base16", &numtext::Base16()},
        {"Base64", &numtext::Base64()},
        {"Base86", &numtext::Base86()},
    };

    for (const auto& a : alphabets)
    {
        std::vector<std::string> strings;
        strings.reserve(numbers.size());
        for (const int64_t n : numbers)
            strings.push_back(numtext::EncodeSigned(n, *a.second));

        Configure(benchmark::RegisterBenchmark((std::string("EncodeSigned - ") + a.first).c_str(), BenchEncodeSigned, numbers, std::cref(*a.second)));
        Configure(benchmark::RegisterBenchmark((std::string("DecodeSigned - ") + a.first).c_str(), BenchDecodeSigned, strings, std::cref(*a.second)));
        Configure(benchmark::RegisterBenchmark((std::string("EncodeBits - ") + a.first).c_str(), BenchEncodeBits, doubles, std::cref(*a.second)));
    }
}

//==================================================================================================
// Join/split
//==================================================================================================

static void Register_JoinSplit()
{
    std::vector<double> numbers(1000);
    std::uniform_real_distribution<double> gen(-1e6, 1e6);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(rng); });

    const numtext::PlainDecimalCodec<double> plain;
    const numtext::DecimalCodec<double> b64(numtext::Base64());
    const numtext::CompactBitsCodec<double> compact;

    Configure(benchmark::RegisterBenchmark("Join 1000 - plain decimal", [=](benchmark::State& state) {
        for (auto _ : state)
            benchmark::DoNotOptimize(numtext::Join(",", numbers, plain));
    }));

    Configure(benchmark::RegisterBenchmark("Join 1000 - Base64 decimal", [=](benchmark::State& state) {
        for (auto _ : state)
            benchmark::DoNotOptimize(numtext::Join(",", numbers, b64));
    }));

    const std::string plain_text = numtext::Join(",", numbers, plain);
    Configure(benchmark::RegisterBenchmark("Split 1000 - plain decimal", [=](benchmark::State& state) {
        std::vector<double> values;
        for (auto _ : state)
        {
            const auto res = numtext::Split(plain_text, ",", plain, values);
            if (!res)
                state.SkipWithError(numtext::ToString(res.status));
            benchmark::DoNotOptimize(values.data());
        }
    }));

    const std::string compact_text = numtext::Join(",", numbers, compact);
    Configure(benchmark::RegisterBenchmark("Split 1000 - compact bits", [=](benchmark::State& state) {
        std::vector<double> values;
        for (auto _ : state)
        {
            const auto res = numtext::Split(compact_text, ",", compact, values);
            if (!res)
                state.SkipWithError(numtext::ToString(res.status));
            benchmark::DoNotOptimize(values.data());
        }
    }));
}

//==================================================================================================
//
//==================================================================================================

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    printf("Preparing benchmarks...\n");

    Register_RandomBits();
    Register_Uniform(0.0, 1.0);
    Register_Uniform(0.0, 1.0e+308);
    Register_Uniform(1.0f, 2.0f);
    for (int d = 1; d <= 15; d += 2)
        Register_ShortDigits(d);

    Register_Integers();
    Register_JoinSplit();

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}
