#include "image_io.h"
#include "sds_error.h"
#include "sds_ggml.h"
#include "sds_loader.h"
#include "sds_log.h"
#include "sds_pipeline.h"
#include "sds_profile.h"
#include "sds_scheduler.h"

#include "ggml.h"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

using namespace sds;

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "usage: %s [--profile P.json] [--scheduler-gguf M.gguf] [--scheduler lms|euler_a]\n"
        "          [--steps N] [--guidance S] [--seed N] [--batch N] [--width W] [--height H]\n"
        "          [--preview OUT.png|OUT.ppm] [--save-profile P.json] [--verbose]\n", argv0);
}

static void display_progress(int cur, int total) {
    std::fputc('\r', stdout);
    std::fputc('[', stdout);
    for (int i = 0; i < cur; i++) std::fputc('#', stdout);
    for (int i = 0; i < total - cur; i++) std::fputc('-', stdout);
    std::fprintf(stdout, "]  [%3d%%]", cur * 100 / total);
    if (cur == total) std::fputc('\n', stdout);
    std::fflush(stdout);
}

static bool ends_with(const std::string & s, const std::string & suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "out.png" -> "out_1.png" for batch items after the first
static std::string preview_path(const std::string & base, size_t index) {
    if (index == 0) return base;
    const size_t dot = base.rfind('.');
    const std::string stem = dot == std::string::npos ? base : base.substr(0, dot);
    const std::string ext = dot == std::string::npos ? std::string() : base.substr(dot);
    return stem + "_" + std::to_string(index) + ext;
}

static int run(int argc, char ** argv) {
    SamplerProfile prof;
    std::string scheduler_gguf;
    std::string preview;
    std::string save_profile;

    // --profile is applied first so the other flags override it
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--profile") prof = load_profile_json(argv[i + 1]);
    }

    for (int i = 1; i < argc; ++i) {
        const std::string k = argv[i];
        if (k == "--verbose") { set_log_level(GGML_LOG_LEVEL_DEBUG); continue; }
        if (k == "--help" || k == "-h") { print_usage(argv[0]); return 0; }
        if (i + 1 >= argc) {
            print_usage(argv[0]);
            throw ConfigError("missing value for " + k);
        }
        const std::string v = argv[++i];
        if (k == "--profile") continue;
        else if (k == "--scheduler-gguf") scheduler_gguf = v;
        else if (k == "--scheduler") prof.scheduler = v;
        else if (k == "--steps") prof.steps = std::atoi(v.c_str());
        else if (k == "--guidance") prof.guidance_scale = (float)std::atof(v.c_str());
        else if (k == "--seed") prof.seed = std::strtoull(v.c_str(), nullptr, 10);
        else if (k == "--batch") prof.batch_size = std::atoi(v.c_str());
        else if (k == "--width") prof.width = std::atoi(v.c_str());
        else if (k == "--height") prof.height = std::atoi(v.c_str());
        else if (k == "--preview") preview = v;
        else if (k == "--save-profile") save_profile = v;
        else {
            print_usage(argv[0]);
            throw ConfigError("unknown argument " + k);
        }
    }

    SamplingRequest req;
    req.steps = prof.steps;
    req.guidance_scale = prof.guidance_scale;
    req.batch_size = prof.batch_size;
    req.width = prof.width;
    req.height = prof.height;
    req.seed = prof.seed;
    req.scheduler = scheduler_kind(prof);
    req.scheduler_config = scheduler_config(prof);
    if (!scheduler_gguf.empty()) {
        req.scheduler_config = SchedulerConfig::from_metadata(load_metadata(scheduler_gguf));
        SDS_LOG_INFO("scheduler config from %s", scheduler_gguf.c_str());
    }
    if (!save_profile.empty()) {
        save_profile_json(save_profile, prof);
    }

    {
        std::unique_ptr<Scheduler> preview_sched = make_scheduler(req.scheduler, req.seed, req.scheduler_config);
        const std::vector<int> & ts = preview_sched->set_timesteps(req.steps);
        SDS_LOG_INFO("%s schedule: %zu timesteps from %d to %d, init sigma %.4f",
                     scheduler_display_name(req.scheduler), ts.size(), ts.front(), ts.back(),
                     preview_sched->init_noise_sigma());
    }

    // Stand-in conditioning: a zero [1, 77, 768] CLIP embedding for both halves.
    const FloatTensor empty_prompt(Shape{1, 77, 768});
    const FloatTensor text = req.guided()
        ? build_embedding_batch(empty_prompt, empty_prompt, req.batch_size)
        : build_embedding_batch(empty_prompt, req.batch_size);
    req.text_embedding = &text;

    // Zero noise prediction: the latent stays at its initial sample.
    GgmlDenoiserParams dp;
    dp.timestep_type = GGML_TYPE_I64;
    GgmlDenoiser denoiser([](ggml_context * ctx, const GgmlDenoiseInputs & in) {
        return ggml_scale(ctx, in.sample, 0.0f);
    }, dp);

    const FloatTensor latents = sample_latents(req, denoiser, [&](int step) {
        display_progress(step, req.steps);
    });
    SDS_LOG_INFO("final latent %s", shape_to_string(latents.shape()).c_str());

    if (!preview.empty()) {
        const std::vector<RgbImage> images = latents_to_rgb(latents);
        for (size_t i = 0; i < images.size(); ++i) {
            const std::string path = preview_path(preview, i);
            const RgbImage & img = images[i];
            const bool ok = ends_with(path, ".ppm") ? write_ppm(path, img.width, img.height, img.rgb)
                                                    : write_png(path, img.width, img.height, img.rgb);
            if (!ok) {
                throw Error("failed to write preview " + path);
            }
            SDS_LOG_INFO("preview written to %s (%dx%d)", path.c_str(), img.width, img.height);
        }
    }
    return 0;
}

int main(int argc, char ** argv) {
    route_ggml_logs();
    try {
        return run(argc, argv);
    } catch (const Error & e) {
        SDS_LOG_ERROR("%s", e.what());
        return 1;
    } catch (const std::exception & e) {
        SDS_LOG_ERROR("unexpected error: %s", e.what());
        return 2;
    }
}
