#include "gtest/gtest.h"

#include "sds_denoiser.h"
#include "sds_error.h"
#include "sds_pipeline.h"
#include "sds_scheduler.h"

#include <cmath>
#include <stdexcept>

using namespace sds;

namespace {

struct CallRecord {
    Shape sample_shape;
    std::vector<float> sample;
    TimestepValue timestep;
    bool has_pooled = false;
    bool has_time_ids = false;
    Shape time_ids_shape;
    std::vector<float> time_ids;
};

// Predicts zero noise and records what it was called with.
class RecordingDenoiser : public Denoiser {
public:
    explicit RecordingDenoiser(TimestepType type = TimestepType::INT64) : type(type) {}

    TimestepType timestep_type() const override { return type; }

    FloatTensor denoise(const DenoiseInputs & in) override {
        CallRecord r;
        r.sample_shape = in.sample.shape();
        r.sample = in.sample.values();
        r.timestep = in.timestep;
        r.has_pooled = in.pooled_embedding != nullptr;
        r.has_time_ids = in.time_ids != nullptr;
        if (in.time_ids) {
            r.time_ids_shape = in.time_ids->shape();
            r.time_ids = in.time_ids->values();
        }
        calls.push_back(std::move(r));
        return FloatTensor(in.sample.shape());
    }

    std::vector<CallRecord> calls;

private:
    TimestepType type;
};

class WrongShapeDenoiser : public Denoiser {
public:
    TimestepType timestep_type() const override { return TimestepType::INT64; }
    FloatTensor denoise(const DenoiseInputs &) override { return FloatTensor(Shape{1, 4, 1, 1}); }
};

class FailingDenoiser : public Denoiser {
public:
    TimestepType timestep_type() const override { return TimestepType::INT32; }
    FloatTensor denoise(const DenoiseInputs &) override { throw std::runtime_error("model failed"); }
};

// Constant epsilon prediction.
class ConstantDenoiser : public Denoiser {
public:
    explicit ConstantDenoiser(float value) : value(value) {}
    TimestepType timestep_type() const override { return TimestepType::FLOAT32; }
    FloatTensor denoise(const DenoiseInputs & in) override {
        FloatTensor out(in.sample.shape());
        for (size_t i = 0; i < out.size(); ++i) out[i] = value;
        return out;
    }

private:
    float value;
};

FloatTensor constant(const Shape & shape, float v) {
    FloatTensor t(shape);
    for (size_t i = 0; i < t.size(); ++i) t[i] = v;
    return t;
}

SamplingRequest small_request(const FloatTensor & text, int steps, float guidance) {
    SamplingRequest req;
    req.steps = steps;
    req.guidance_scale = guidance;
    req.batch_size = 1;
    req.height = 64;
    req.width = 64;
    req.seed = 42;
    req.scheduler = SchedulerKind::LMS;
    req.text_embedding = &text;
    return req;
}

}

TEST(PipelineTest, ZeroNoiseLmsRunKeepsInitialLatent) {
    const FloatTensor text(Shape{2, 77, 8});
    const float sigma = LMSDiscreteScheduler().init_noise_sigma();
    const FloatTensor initial = sample_initial_latent(1, 64, 64, sigma, 42);
    for (int steps : {1, 5, 20}) {
        RecordingDenoiser model;
        const FloatTensor out = sample_latents(small_request(text, steps, 7.5f), model);
        EXPECT_EQ(out.shape(), (Shape{1, 4, 8, 8}));
        EXPECT_EQ(out.values(), initial.values()) << "steps = " << steps;
        EXPECT_EQ(model.calls.size(), (size_t)steps);
    }
}

TEST(PipelineTest, InitialLatentIsSeededWithRequestedSpread) {
    const FloatTensor a = sample_initial_latent(2, 128, 128, 3.0f, 7);
    const FloatTensor b = sample_initial_latent(2, 128, 128, 3.0f, 7);
    const FloatTensor c = sample_initial_latent(2, 128, 128, 3.0f, 8);
    EXPECT_EQ(a.shape(), (Shape{2, 4, 16, 16}));
    EXPECT_EQ(a.values(), b.values());
    EXPECT_NE(a.values(), c.values());

    double sum = 0.0, sq = 0.0;
    for (float v : a.values()) { sum += v; sq += (double)v * v; }
    const double n = (double)a.size();
    const double stddev = std::sqrt(sq / n - (sum / n) * (sum / n));
    EXPECT_NEAR(stddev, 3.0, 0.3);
}

TEST(PipelineTest, GuidedRunDuplicatesAndScalesModelInput) {
    const FloatTensor text(Shape{2, 77, 8});
    RecordingDenoiser model;
    sample_latents(small_request(text, 3, 7.5f), model);
    ASSERT_EQ(model.calls.size(), 3u);

    LMSDiscreteScheduler ref;
    const std::vector<int> ts = ref.set_timesteps(3);
    const FloatTensor initial = sample_initial_latent(1, 64, 64, ref.init_noise_sigma(), 42);
    const float scale = 1.0f / std::sqrt(ref.sigmas()[0] * ref.sigmas()[0] + 1.0f);

    const CallRecord & first = model.calls[0];
    EXPECT_EQ(first.sample_shape, (Shape{2, 4, 8, 8}));
    const size_t half = initial.size();
    for (size_t i = 0; i < half; ++i) {
        EXPECT_FLOAT_EQ(first.sample[i], initial[i] * scale);
        EXPECT_FLOAT_EQ(first.sample[half + i], initial[i] * scale);
    }
    for (size_t t = 0; t < ts.size(); ++t) {
        EXPECT_EQ(model.calls[t].timestep.as_i64(), ts[t]);
        EXPECT_FALSE(model.calls[t].has_pooled);
        EXPECT_FALSE(model.calls[t].has_time_ids);
    }
}

TEST(PipelineTest, UnguidedRunUsesSingleBatch) {
    const FloatTensor text(Shape{1, 77, 8});
    RecordingDenoiser model;
    sample_latents(small_request(text, 2, 0.5f), model);
    ASSERT_EQ(model.calls.size(), 2u);
    EXPECT_EQ(model.calls[0].sample_shape, (Shape{1, 4, 8, 8}));
}

TEST(PipelineTest, TimestepUsesDeclaredType) {
    const FloatTensor text(Shape{2, 77, 8});
    RecordingDenoiser model(TimestepType::FLOAT64);
    sample_latents(small_request(text, 2, 7.5f), model);
    ASSERT_EQ(model.calls.size(), 2u);
    EXPECT_EQ(model.calls[0].timestep.type, TimestepType::FLOAT64);
    EXPECT_DOUBLE_EQ(model.calls[1].timestep.as_f64(), 0.0);
}

TEST(PipelineTest, SdxlPassesPooledEmbeddingAndTimeIds) {
    const FloatTensor text(Shape{2, 77, 16});
    const FloatTensor pooled(Shape{2, 1280});
    RecordingDenoiser model;
    SamplingRequest req = small_request(text, 1, 5.0f);
    req.height = 64;
    req.width = 128;
    req.pooled_embedding = &pooled;
    sample_latents(req, model);

    ASSERT_EQ(model.calls.size(), 1u);
    const CallRecord & c = model.calls[0];
    EXPECT_TRUE(c.has_pooled);
    ASSERT_TRUE(c.has_time_ids);
    EXPECT_EQ(c.sample_shape, (Shape{2, 4, 8, 16}));
    EXPECT_EQ(c.time_ids_shape, (Shape{2, 6}));
    const std::vector<float> row = {64, 128, 0, 0, 64, 128};
    for (size_t r = 0; r < 2; ++r) {
        for (size_t k = 0; k < 6; ++k) EXPECT_EQ(c.time_ids[r * 6 + k], row[k]);
    }
}

TEST(PipelineTest, SdxlCustomAuxConditioning) {
    const FloatTensor text(Shape{1, 77, 16});
    const FloatTensor pooled(Shape{1, 1280});
    RecordingDenoiser model;
    SamplingRequest req = small_request(text, 1, 0.0f);
    req.pooled_embedding = &pooled;
    req.has_aux = true;
    req.aux.original_height = 1024;
    req.aux.original_width = 768;
    req.aux.crop_top = 16;
    req.aux.crop_left = 8;
    req.aux.target_height = 64;
    req.aux.target_width = 64;
    sample_latents(req, model);

    ASSERT_EQ(model.calls.size(), 1u);
    EXPECT_EQ(model.calls[0].time_ids_shape, (Shape{1, 6}));
    EXPECT_EQ(model.calls[0].time_ids, (std::vector<float>{1024, 768, 16, 8, 64, 64}));
}

TEST(PipelineTest, ProgressCallbackCountsSteps) {
    const FloatTensor text(Shape{2, 77, 8});
    RecordingDenoiser model;
    std::vector<int> seen;
    sample_latents(small_request(text, 4, 7.5f), model, [&](int step) { seen.push_back(step); });
    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3, 4}));
}

TEST(PipelineTest, WrongModelOutputShapeIsShapeError) {
    const FloatTensor text(Shape{2, 77, 8});
    WrongShapeDenoiser model;
    EXPECT_THROW(sample_latents(small_request(text, 2, 7.5f), model), ShapeError);
}

TEST(PipelineTest, ModelErrorsPropagate) {
    const FloatTensor text(Shape{2, 77, 8});
    FailingDenoiser model;
    EXPECT_THROW(sample_latents(small_request(text, 2, 7.5f), model), std::runtime_error);
}

TEST(PipelineTest, EulerAncestralRunIsReproducible) {
    const FloatTensor text(Shape{2, 77, 8});
    ConstantDenoiser model(0.1f);
    SamplingRequest req = small_request(text, 4, 7.5f);
    req.scheduler = SchedulerKind::EULER_ANCESTRAL;
    const FloatTensor a = sample_latents(req, model);
    const FloatTensor b = sample_latents(req, model);
    req.seed = 43;
    const FloatTensor c = sample_latents(req, model);
    EXPECT_EQ(a.values(), b.values());
    EXPECT_NE(a.values(), c.values());
}

TEST(PipelineTest, RequestValidation) {
    const FloatTensor guided_text(Shape{2, 77, 8});
    const FloatTensor single_text(Shape{1, 77, 8});

    EXPECT_NO_THROW(validate(small_request(guided_text, 1, 7.5f)));
    EXPECT_NO_THROW(validate(small_request(single_text, 1, 0.9f)));
    EXPECT_THROW(validate(small_request(single_text, 1, 7.5f)), ConfigError);
    EXPECT_THROW(validate(small_request(guided_text, 1, 0.5f)), ConfigError);
    EXPECT_THROW(validate(small_request(guided_text, 0, 7.5f)), ConfigError);

    SamplingRequest req = small_request(guided_text, 1, 7.5f);
    req.height = 60;
    EXPECT_THROW(validate(req), ConfigError);
    req.height = 64;
    req.width = 0;
    EXPECT_THROW(validate(req), ConfigError);
    req.width = 64;
    req.batch_size = 0;
    EXPECT_THROW(validate(req), ConfigError);
    req.batch_size = 1;
    req.text_embedding = nullptr;
    EXPECT_THROW(validate(req), ConfigError);
}

TEST(GuidanceTest, ScaleOneIsTextAndZeroIsUnconditional) {
    FloatTensor pred(Shape{2, 4, 2, 2});
    for (size_t i = 0; i < pred.size(); ++i) pred[i] = i < pred.size() / 2 ? 1.0f : 3.0f;

    const FloatTensor text_only = apply_guidance(pred, 1.0f);
    const FloatTensor uncond_only = apply_guidance(pred, 0.0f);
    const FloatTensor strong = apply_guidance(pred, 7.5f);
    EXPECT_EQ(text_only.shape(), (Shape{1, 4, 2, 2}));
    for (size_t i = 0; i < text_only.size(); ++i) {
        EXPECT_FLOAT_EQ(text_only[i], 3.0f);
        EXPECT_FLOAT_EQ(uncond_only[i], 1.0f);
        EXPECT_FLOAT_EQ(strong[i], 16.0f);
    }

    EXPECT_THROW(apply_guidance(FloatTensor(Shape{3, 4}), 2.0f), ShapeError);
}

TEST(GuidanceTest, DuplicateBatchStacksCopies) {
    FloatTensor x = constant(Shape{2, 3}, 0.0f);
    x.set({1, 2}, 9.0f);
    const FloatTensor d = duplicate_batch(x);
    EXPECT_EQ(d.shape(), (Shape{4, 3}));
    EXPECT_EQ(d.get({1, 2}), 9.0f);
    EXPECT_EQ(d.get({3, 2}), 9.0f);
    EXPECT_EQ(d.get({2, 2}), 0.0f);
}

TEST(EmbeddingBatchTest, GuidedBatchPutsUnconditionalFirst) {
    const FloatTensor uncond = constant(Shape{1, 4, 3}, 1.0f);
    const FloatTensor cond = constant(Shape{1, 4, 3}, 2.0f);
    const FloatTensor batch = build_embedding_batch(uncond, cond, 2);
    ASSERT_EQ(batch.shape(), (Shape{4, 4, 3}));
    EXPECT_EQ(batch.get({0, 3, 2}), 1.0f);
    EXPECT_EQ(batch.get({1, 0, 0}), 1.0f);
    EXPECT_EQ(batch.get({2, 0, 0}), 2.0f);
    EXPECT_EQ(batch.get({3, 3, 2}), 2.0f);

    const FloatTensor single = build_embedding_batch(cond, 3);
    EXPECT_EQ(single.shape(), (Shape{3, 4, 3}));

    EXPECT_THROW(build_embedding_batch(uncond, constant(Shape{1, 5, 3}, 0.0f), 1), ShapeError);
    EXPECT_THROW(build_embedding_batch(constant(Shape{2, 4, 3}, 0.0f), 1), ShapeError);
}

TEST(EmbeddingBatchTest, SdxlHiddenStatesConcatenateEncoders) {
    const FloatTensor clip_l = constant(Shape{1, 77, 768}, 1.0f);
    const FloatTensor clip_g = constant(Shape{1, 77, 1280}, 2.0f);
    const FloatTensor hidden = FloatTensor::concat(clip_l, clip_g);
    EXPECT_EQ(hidden.shape(), (Shape{1, 77, 2048}));
    EXPECT_EQ(hidden.get({0, 5, 767}), 1.0f);
    EXPECT_EQ(hidden.get({0, 5, 768}), 2.0f);
}

TEST(LatentScaleTest, UnscaleDividesByFactor) {
    const FloatTensor latents = constant(Shape{1, 4, 2, 2}, kDefaultLatentScale);
    const FloatTensor out = unscale_latents(latents);
    for (size_t i = 0; i < out.size(); ++i) EXPECT_NEAR(out[i], 1.0f, 1e-6);
    EXPECT_FLOAT_EQ(latents[0], kDefaultLatentScale);
    EXPECT_THROW(unscale_latents(latents, 0.0f), ConfigError);
}

TEST(TimestepValueTest, EncodesEachType) {
    const TimestepValue v = TimestepValue::encode(TimestepType::INT32, 981);
    EXPECT_EQ(v.type, TimestepType::INT32);
    EXPECT_EQ(v.as_i32(), 981);
    EXPECT_EQ(v.as_i64(), 981);
    EXPECT_FLOAT_EQ(v.as_f32(), 981.0f);
    EXPECT_DOUBLE_EQ(v.as_f64(), 981.0);
    EXPECT_STREQ(timestep_type_name(TimestepType::FLOAT64), "f64");
}
