// =============================================================================
// dnac - Codec Pipeline Tests
// =============================================================================
// End-to-end tests for encode/decode: round trips at chunk boundaries,
// encryption, error correction, and consolidated fault reporting.
// =============================================================================

#include "dnac/pipeline/codec_pipeline.h"

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "dnac/codec/symbol_codec.h"
#include "dnac/crypto/envelope.h"
#include "dnac/format/chunker.h"

namespace dnac::pipeline::test {

namespace {

constexpr std::uint32_t kFastKdfIterations = KdfParams::kMinIterations;

Bytes makePayload(std::size_t size, std::uint32_t seed = 1) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    Bytes payload(size);
    for (auto& b : payload) {
        b = static_cast<std::uint8_t>(dist(rng));
    }
    return payload;
}

EncodeOptions encodeOptions(ErrorCorrectionLevel level, std::uint32_t baseLength = 200) {
    EncodeOptions options;
    options.level = level;
    options.baseLength = baseLength;
    options.numThreads = 2;
    return options;
}

DecodeOptions decodeOptions(ErrorCorrectionLevel declared) {
    DecodeOptions options;
    options.declaredLevel = declared;
    options.numThreads = 2;
    return options;
}

/// @brief Replace one symbol in each listed byte of a sequence.
void corruptBytes(std::string& sequence, const std::vector<std::size_t>& bytePositions) {
    for (std::size_t byte : bytePositions) {
        char& symbol = sequence[byte * kSymbolsPerByte];
        const std::uint8_t code = codec::symbolCode(symbol);
        symbol = codec::kSymbolAlphabet[(code + 1) % codec::kSymbolAlphabet.size()];
    }
}

std::vector<std::size_t> firstPositions(std::size_t count, std::size_t stride) {
    std::vector<std::size_t> positions;
    for (std::size_t i = 0; i < count; ++i) {
        positions.push_back(i * stride);
    }
    return positions;
}

}  // namespace

// =============================================================================
// Round Trips
// =============================================================================

TEST(CodecPipelineTest, RoundTripAtChunkBoundaries) {
    for (ErrorCorrectionLevel level :
         {ErrorCorrectionLevel::kBasic, ErrorCorrectionLevel::kAdvanced}) {
        for (std::uint32_t baseLength : {200U, 256U, 1020U}) {
            const std::size_t chunk = *format::chunkCapacity(baseLength, level);
            for (std::size_t size :
                 {std::size_t{0}, std::size_t{1}, chunk - 1, chunk, chunk + 1, 3 * chunk,
                  3 * chunk + 1}) {
                SCOPED_TRACE(testing::Message() << "level " << levelToString(level) << ", base "
                                                << baseLength << ", size " << size);
                const Bytes payload = makePayload(size, static_cast<std::uint32_t>(size));

                auto encoded = encode(payload, encodeOptions(level, baseLength));
                ASSERT_TRUE(encoded.has_value()) << encoded.error().describe();
                EXPECT_EQ(encoded->sequences.size(), format::chunkCount(size, chunk));
                EXPECT_EQ(encoded->metadata.chunkSize, chunk);

                auto decoded = decode(encoded->sequences, decodeOptions(level));
                ASSERT_TRUE(decoded.has_value()) << decoded.error().describe();
                EXPECT_EQ(decoded->payload, payload);
                EXPECT_EQ(decoded->stats.correctedBytes, 0u);
            }
        }
    }
}

TEST(CodecPipelineTest, SequenceShapeAndMetadata) {
    const Bytes payload = makePayload(40);
    auto encoded = encode(payload, encodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_TRUE(encoded.has_value());

    // 16 data bytes per chunk: 16 + 16 + 8
    ASSERT_EQ(encoded->sequences.size(), 3u);
    EXPECT_EQ(encoded->sequences[0].size(), 200u);
    EXPECT_EQ(encoded->sequences[1].size(), 200u);
    EXPECT_EQ(encoded->sequences[2].size(), (26u + 8u + 8u) * 4u);
    for (const auto& sequence : encoded->sequences) {
        EXPECT_TRUE(std::all_of(sequence.begin(), sequence.end(), codec::isValidSymbol));
    }

    const auto& meta = encoded->metadata;
    EXPECT_EQ(meta.originalSize, 40u);
    EXPECT_EQ(meta.encodedSize, 40u);
    EXPECT_EQ(meta.sequenceCount, 3u);
    EXPECT_EQ(meta.baseLength, 200u);
    EXPECT_EQ(meta.level, ErrorCorrectionLevel::kBasic);
    EXPECT_FALSE(meta.isEncrypted);
    EXPECT_FALSE(encoded->constraints.has_value());
}

TEST(CodecPipelineTest, ShuffledAndLowerCaseInput) {
    const Bytes payload = makePayload(500);
    auto encoded = encode(payload, encodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_TRUE(encoded.has_value());

    auto sequences = encoded->sequences;
    std::mt19937 rng(7);
    std::shuffle(sequences.begin(), sequences.end(), rng);
    for (char& c : sequences.front()) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto decoded = decode(sequences, decodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().describe();
    EXPECT_EQ(decoded->payload, payload);
}

TEST(CodecPipelineTest, DeclaredLevelIsAdvisory) {
    const Bytes payload = makePayload(300);
    auto encoded = encode(payload, encodeOptions(ErrorCorrectionLevel::kAdvanced));
    ASSERT_TRUE(encoded.has_value());

    auto sequences = encoded->sequences;
    corruptBytes(sequences[1], {3, 17});

    auto decoded = decode(sequences, decodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().describe();
    EXPECT_EQ(decoded->payload, payload);
    EXPECT_EQ(decoded->stats.level, ErrorCorrectionLevel::kAdvanced);
    EXPECT_EQ(decoded->stats.correctedBytes, 2u);
}

TEST(CodecPipelineTest, ConstraintReportOnRequest) {
    EncodeOptions options = encodeOptions(ErrorCorrectionLevel::kBasic);
    options.checkConstraints = true;

    auto encoded = encode(makePayload(100), options);
    ASSERT_TRUE(encoded.has_value());
    ASSERT_TRUE(encoded->constraints.has_value());
    EXPECT_EQ(encoded->constraints->sequences.size(), encoded->sequences.size());
}

// =============================================================================
// Configuration
// =============================================================================

TEST(CodecPipelineTest, BaseLengthTooSmall) {
    auto basic = encode(makePayload(10), encodeOptions(ErrorCorrectionLevel::kBasic, 136));
    ASSERT_FALSE(basic.has_value());
    EXPECT_EQ(basic.error().code(), ErrorCode::kConfigurationError);

    auto advanced = encode(makePayload(10), encodeOptions(ErrorCorrectionLevel::kAdvanced, 160));
    ASSERT_FALSE(advanced.has_value());
    EXPECT_EQ(advanced.error().code(), ErrorCode::kConfigurationError);

    auto unaligned = encode(makePayload(10), encodeOptions(ErrorCorrectionLevel::kBasic, 202));
    ASSERT_FALSE(unaligned.has_value());
    EXPECT_EQ(unaligned.error().code(), ErrorCode::kConfigurationError);
}

TEST(CodecPipelineTest, InvalidKdfIsConfigurationError) {
    EncodeOptions options = encodeOptions(ErrorCorrectionLevel::kBasic);
    options.password = "pw";
    options.kdf.iterations = 1;

    auto encoded = encode(makePayload(10), options);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code(), ErrorCode::kConfigurationError);
}

TEST(CodecPipelineTest, EmptyPasswordIsConfigurationError) {
    EncodeOptions options = encodeOptions(ErrorCorrectionLevel::kBasic);
    options.password = "";
    EXPECT_EQ(encode(makePayload(10), options).error().code(), ErrorCode::kConfigurationError);

    auto encoded = encode(makePayload(10), encodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_TRUE(encoded.has_value());
    DecodeOptions decodeOpts;
    decodeOpts.password = "";
    EXPECT_EQ(decode(encoded->sequences, decodeOpts).error().code(),
              ErrorCode::kConfigurationError);
}

TEST(CodecPipelineTest, NoSequencesIsValidationError) {
    auto decoded = decode(std::vector<std::string>{});
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kValidationError);
}

// =============================================================================
// Encryption
// =============================================================================

class EncryptedPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        payload_ = makePayload(250);
        EncodeOptions options = encodeOptions(ErrorCorrectionLevel::kBasic);
        options.password = "s3cret";
        options.kdf.iterations = kFastKdfIterations;
        auto encoded = encode(payload_, options);
        ASSERT_TRUE(encoded.has_value()) << encoded.error().describe();
        encoded_ = std::move(*encoded);
    }

    Bytes payload_;
    EncodeResult encoded_;
};

TEST_F(EncryptedPipelineTest, RoundTrip) {
    EXPECT_TRUE(encoded_.metadata.isEncrypted);
    EXPECT_EQ(encoded_.metadata.originalSize, payload_.size());
    EXPECT_EQ(encoded_.metadata.encodedSize, payload_.size() + 49u);

    DecodeOptions options = decodeOptions(ErrorCorrectionLevel::kBasic);
    options.password = "s3cret";
    auto decoded = decode(encoded_.sequences, options);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().describe();
    EXPECT_EQ(decoded->payload, payload_);
    EXPECT_TRUE(decoded->stats.isEncrypted);
}

TEST_F(EncryptedPipelineTest, WrongPassword) {
    DecodeOptions options = decodeOptions(ErrorCorrectionLevel::kBasic);
    options.password = "s3cret!";
    auto decoded = decode(encoded_.sequences, options);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kAuthenticationError);
}

TEST_F(EncryptedPipelineTest, MissingPassword) {
    auto decoded = decode(encoded_.sequences, decodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kAuthenticationError);
}

TEST_F(EncryptedPipelineTest, CorrectionStillAppliesUnderEncryption) {
    auto sequences = encoded_.sequences;
    corruptBytes(sequences[0], firstPositions(4, 9));

    DecodeOptions options = decodeOptions(ErrorCorrectionLevel::kBasic);
    options.password = "s3cret";
    auto decoded = decode(sequences, options);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().describe();
    EXPECT_EQ(decoded->payload, payload_);
    EXPECT_EQ(decoded->stats.correctedChunks, 1u);
}

TEST(CodecPipelineTest, EncryptedRoundTripAtChunkBoundaries) {
    for (ErrorCorrectionLevel level :
         {ErrorCorrectionLevel::kBasic, ErrorCorrectionLevel::kAdvanced}) {
        const auto capacity = format::chunkCapacity(kDefaultBaseLength, level);
        ASSERT_TRUE(capacity.has_value());

        // Sizes where the sealed stream lands on, or next to, a chunk boundary
        std::vector<std::size_t> sizes = {0, 1};
        for (std::size_t chunks : {7U, 12U}) {
            const std::size_t boundary = chunks * *capacity - crypto::kEnvelopeOverhead;
            sizes.insert(sizes.end(), {boundary - 1, boundary, boundary + 1});
        }

        for (std::size_t size : sizes) {
            const Bytes payload = makePayload(size, static_cast<std::uint32_t>(size) + 3);
            EncodeOptions options = encodeOptions(level);
            options.password = "boundary";
            options.kdf.iterations = kFastKdfIterations;
            auto encoded = encode(payload, options);
            ASSERT_TRUE(encoded.has_value()) << encoded.error().describe();

            DecodeOptions decodeOpts = decodeOptions(level);
            decodeOpts.password = "boundary";
            auto decoded = decode(encoded->sequences, decodeOpts);
            ASSERT_TRUE(decoded.has_value())
                << levelToString(level) << " size " << size << ": " << decoded.error().describe();
            EXPECT_EQ(decoded->payload, payload);
        }
    }
}

TEST(CodecPipelineTest, PasswordForPlainSetIsIgnored) {
    const Bytes payload = makePayload(64);
    auto encoded = encode(payload, encodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_TRUE(encoded.has_value());

    DecodeOptions options = decodeOptions(ErrorCorrectionLevel::kBasic);
    options.password = "unused";
    auto decoded = decode(encoded->sequences, options);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->payload, payload);
    EXPECT_FALSE(decoded->stats.isEncrypted);
}

// =============================================================================
// Error Correction
// =============================================================================

TEST(CodecPipelineTest, CorrectsUpToBoundInEveryChunk) {
    for (ErrorCorrectionLevel level :
         {ErrorCorrectionLevel::kBasic, ErrorCorrectionLevel::kAdvanced}) {
        const Bytes payload = makePayload(400);
        auto encoded = encode(payload, encodeOptions(level));
        ASSERT_TRUE(encoded.has_value());

        auto sequences = encoded->sequences;
        const std::size_t bound = correctionBound(level);
        for (auto& sequence : sequences) {
            corruptBytes(sequence, firstPositions(bound, 5));
        }

        auto decoded = decode(sequences, decodeOptions(level));
        ASSERT_TRUE(decoded.has_value()) << decoded.error().describe();
        EXPECT_EQ(decoded->payload, payload);
        EXPECT_EQ(decoded->stats.correctedChunks, sequences.size());
        EXPECT_EQ(decoded->stats.correctedBytes, sequences.size() * bound);
    }
}

TEST(CodecPipelineTest, BeyondBoundFailsInsteadOfReturningGarbage) {
    for (ErrorCorrectionLevel level :
         {ErrorCorrectionLevel::kBasic, ErrorCorrectionLevel::kAdvanced}) {
        const Bytes payload = makePayload(100);
        auto encoded = encode(payload, encodeOptions(level));
        ASSERT_TRUE(encoded.has_value());

        auto sequences = encoded->sequences;
        corruptBytes(sequences[2], firstPositions(correctionBound(level) + 1, 5));

        auto decoded = decode(sequences, decodeOptions(level));
        ASSERT_FALSE(decoded.has_value()) << levelToString(level);
        const auto& faults = decoded.error().faults();
        ASSERT_FALSE(faults.empty());
        EXPECT_TRUE(faults[0].code == ErrorCode::kUncorrectableError ||
                    faults[0].code == ErrorCode::kChecksumMismatch)
            << levelToString(level) << ": " << faults[0].format();
        EXPECT_EQ(faults[0].sequencePosition, std::optional<std::size_t>{2});
    }
}

// =============================================================================
// Fault Reporting
// =============================================================================

TEST(CodecPipelineTest, MissingChunkNamesIndex) {
    auto encoded = encode(makePayload(100), encodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_TRUE(encoded.has_value());

    auto sequences = encoded->sequences;
    sequences.erase(sequences.begin() + 3);

    auto decoded = decode(sequences, decodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kMissingChunk);
    ASSERT_EQ(decoded.error().faults().size(), 1u);
    EXPECT_EQ(decoded.error().faults()[0].chunkIndex, std::optional<std::uint32_t>{3});
}

TEST(CodecPipelineTest, DuplicateChunkIsValidationError) {
    auto encoded = encode(makePayload(100), encodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_TRUE(encoded.has_value());

    auto sequences = encoded->sequences;
    sequences.push_back(sequences[1]);

    auto decoded = decode(sequences, decodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kValidationError);
    ASSERT_EQ(decoded.error().faults().size(), 1u);
    EXPECT_EQ(decoded.error().faults()[0].chunkIndex, std::optional<std::uint32_t>{1});
}

TEST(CodecPipelineTest, ChunksFromAnotherBaseLengthAreRejected) {
    const Bytes payload = makePayload(40);
    auto narrow = encode(payload, encodeOptions(ErrorCorrectionLevel::kBasic, 200));
    auto wide = encode(payload, encodeOptions(ErrorCorrectionLevel::kBasic, 204));
    ASSERT_TRUE(narrow.has_value());
    ASSERT_TRUE(wide.has_value());
    ASSERT_EQ(narrow->sequences.size(), 3u);
    ASSERT_EQ(wide->sequences.size(), 3u);

    // Same count, length and level in every header; only the chunk sizes differ
    const std::vector<std::string> mixed = {wide->sequences[0], narrow->sequences[1],
                                            narrow->sequences[2]};
    auto decoded = decode(mixed, decodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kValidationError);
    const auto& faults = decoded.error().faults();
    ASSERT_EQ(faults.size(), 2u);
    EXPECT_EQ(faults[0].chunkIndex, std::optional<std::uint32_t>{1});
    EXPECT_EQ(faults[1].chunkIndex, std::optional<std::uint32_t>{2});
}

TEST(CodecPipelineTest, ReportsEveryBrokenChunkAtOnce) {
    auto encoded = encode(makePayload(100), encodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_TRUE(encoded.has_value());
    ASSERT_GE(encoded->sequences.size(), 5u);

    auto sequences = encoded->sequences;
    sequences[1][10] = 'N';
    sequences[3].pop_back();

    auto decoded = decode(sequences, decodeOptions(ErrorCorrectionLevel::kBasic));
    ASSERT_FALSE(decoded.has_value());
    const auto& faults = decoded.error().faults();
    ASSERT_EQ(faults.size(), 4u);

    // Per-chunk faults by input position
    EXPECT_EQ(faults[0].code, ErrorCode::kValidationError);
    EXPECT_EQ(faults[0].sequencePosition, std::optional<std::size_t>{1});
    EXPECT_EQ(faults[1].code, ErrorCode::kValidationError);
    EXPECT_EQ(faults[1].sequencePosition, std::optional<std::size_t>{3});

    // Then the gaps they leave, by chunk index
    EXPECT_EQ(faults[2].code, ErrorCode::kMissingChunk);
    EXPECT_EQ(faults[2].chunkIndex, std::optional<std::uint32_t>{1});
    EXPECT_EQ(faults[3].code, ErrorCode::kMissingChunk);
    EXPECT_EQ(faults[3].chunkIndex, std::optional<std::uint32_t>{3});

    EXPECT_EQ(decoded.error().code(), ErrorCode::kValidationError);
}

// =============================================================================
// Observer and Probe
// =============================================================================

TEST(CodecPipelineTest, ObserverSeesStages) {
    std::vector<PipelineStage> stages;
    Encoder encoder(encodeOptions(ErrorCorrectionLevel::kBasic));
    encoder.setObserver([&stages](PipelineStage stage) { stages.push_back(stage); });

    auto encoded = encoder.encode(makePayload(20));
    ASSERT_TRUE(encoded.has_value());
    ASSERT_FALSE(stages.empty());
    EXPECT_EQ(stages.front(), PipelineStage::kValidatingInput);
    EXPECT_EQ(stages.back(), PipelineStage::kDone);
    EXPECT_EQ(std::count(stages.begin(), stages.end(), PipelineStage::kEncrypting), 0);

    stages.clear();
    Decoder decoder(decodeOptions(ErrorCorrectionLevel::kBasic));
    decoder.setObserver([&stages](PipelineStage stage) { stages.push_back(stage); });
    auto decoded = decoder.decode(std::vector<std::string>{"ATCG"});
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(stages.back(), PipelineStage::kFailed);
}

TEST(CodecPipelineTest, StageNames) {
    EXPECT_EQ(pipelineStageToString(PipelineStage::kReassembling), "reassembling");
    EXPECT_EQ(pipelineStageToString(PipelineStage::kDone), "done");
}

TEST(CodecPipelineTest, HealthProbe) {
    const HealthStatus status = health();
    EXPECT_EQ(status.status, "healthy");
    EXPECT_EQ(status.version, kLibraryVersion);
}

TEST(CodecPipelineTest, EffectiveThreads) {
    EncodeOptions options;
    EXPECT_GE(options.effectiveThreads(), 1u);
    EXPECT_LE(options.effectiveThreads(), kMaxAutoThreads);
    options.numThreads = 3;
    EXPECT_EQ(options.effectiveThreads(), 3u);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(CodecPipelineProperty, RoundTripAnyOrder, ()) {
    const auto level =
        *rc::gen::element(ErrorCorrectionLevel::kBasic, ErrorCorrectionLevel::kAdvanced);
    const auto baseLength = *rc::gen::element(200U, 400U, 1020U);
    const auto payload =
        *rc::gen::container<Bytes>(*rc::gen::inRange<std::size_t>(0, 2000),
                                   rc::gen::arbitrary<std::uint8_t>());

    EncodeOptions options = encodeOptions(level, baseLength);
    options.numThreads = *rc::gen::inRange<std::size_t>(1, 5);
    auto encoded = encode(payload, options);
    RC_ASSERT(encoded.has_value());

    auto sequences = encoded->sequences;
    const auto seed = *rc::gen::arbitrary<std::uint32_t>();
    std::mt19937 rng(seed);
    std::shuffle(sequences.begin(), sequences.end(), rng);

    auto decoded = decode(sequences, decodeOptions(level));
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(decoded->payload == payload);
}

RC_GTEST_PROP(CodecPipelineProperty, EncryptedRoundTripAnyPassword, ()) {
    const auto level =
        *rc::gen::element(ErrorCorrectionLevel::kBasic, ErrorCorrectionLevel::kAdvanced);
    const auto baseLength = *rc::gen::element(200U, 400U, 1020U);
    const auto size = *rc::gen::oneOf(rc::gen::inRange<std::size_t>(0, 1200),
                                      rc::gen::element(std::size_t{0}, std::size_t{1}));
    const auto payload = *rc::gen::container<Bytes>(size, rc::gen::arbitrary<std::uint8_t>());
    const auto password = *rc::gen::nonEmpty(rc::gen::string<std::string>());

    EncodeOptions options = encodeOptions(level, baseLength);
    options.password = password;
    options.kdf.iterations = kFastKdfIterations;
    auto encoded = encode(payload, options);
    RC_ASSERT(encoded.has_value());

    DecodeOptions decodeOpts = decodeOptions(level);
    decodeOpts.password = password;
    auto decoded = decode(encoded->sequences, decodeOpts);
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(decoded->payload == payload);

    decodeOpts.password = password + "x";
    auto rejected = decode(encoded->sequences, decodeOpts);
    RC_ASSERT(!rejected.has_value());
    RC_ASSERT(rejected.error().code() == ErrorCode::kAuthenticationError);
}

RC_GTEST_PROP(CodecPipelineProperty, CorrectsRandomErrorsWithinBound, ()) {
    const auto level =
        *rc::gen::element(ErrorCorrectionLevel::kBasic, ErrorCorrectionLevel::kAdvanced);
    const auto payload =
        *rc::gen::container<Bytes>(*rc::gen::inRange<std::size_t>(1, 600),
                                   rc::gen::arbitrary<std::uint8_t>());

    auto encoded = encode(payload, encodeOptions(level));
    RC_ASSERT(encoded.has_value());

    auto sequences = encoded->sequences;
    std::size_t injected = 0;
    for (auto& sequence : sequences) {
        const std::size_t bytes = sequence.size() / kSymbolsPerByte;
        const auto count = *rc::gen::inRange<std::size_t>(0, correctionBound(level) + 1);
        const auto positions = *rc::gen::unique<std::vector<std::size_t>>(
            count, rc::gen::inRange<std::size_t>(0, bytes));
        corruptBytes(sequence, positions);
        injected += count;
    }

    auto decoded = decode(sequences, decodeOptions(level));
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(decoded->payload == payload);
    RC_ASSERT(decoded->stats.correctedBytes == injected);
}

}  // namespace dnac::pipeline::test
