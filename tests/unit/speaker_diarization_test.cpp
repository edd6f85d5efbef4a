#undef NDEBUG
#include <cassert>
#include <cmath>
#include <vector>
#include "diar/mel_features.hpp"
#include "diar/onnx_diarizer.hpp"
#include "diar/speaker_cluster.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {
bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) < eps; }
} // namespace

int main() {
    // Cosine similarity
    assert(near(diar::cosine_similarity({1.0f, 0.0f}, {2.0f, 0.0f}), 1.0));
    assert(near(diar::cosine_similarity({1.0f, 0.0f}, {0.0f, 1.0f}), 0.0));
    assert(near(diar::cosine_similarity({1.0f, 0.0f}, {-1.0f, 0.0f}), -1.0));
    assert(diar::cosine_similarity({}, {}) == 0.0f);
    assert(diar::cosine_similarity({1.0f}, {1.0f, 2.0f}) == 0.0f);

    // Clusterer: two orthogonal voices, hysteresis before a switch
    {
        diar::SpeakerClusterer clusterer;
        const std::vector<float> a = {1.0f, 0.0f, 0.0f};
        const std::vector<float> b = {0.0f, 1.0f, 0.0f};
        assert(clusterer.assign({}) == -1);
        assert(clusterer.assign(a) == 0);
        // Not settled yet: stays with speaker 0
        assert(clusterer.assign(b) == 0);
        assert(clusterer.assign(a) == 0);
        assert(clusterer.assign(a) == 0);
        assert(clusterer.assign(a) == 0);
        assert(clusterer.assign(b) == 1);
        assert(clusterer.num_speakers() == 2);
        // max_speakers reached: a third voice maps onto an existing cluster
        const std::vector<float> c = {0.0f, 0.0f, 1.0f};
        for (int i = 0; i < 5; ++i) assert(clusterer.assign(b) == 1);
        const int who = clusterer.assign(c);
        assert(who == 0 || who == 1);
        assert(clusterer.num_speakers() == 2);
        clusterer.reset();
        assert(clusterer.num_speakers() == 0 && clusterer.current_speaker() == -1);
    }

    // FFT of an impulse is flat
    {
        std::vector<float> re(8, 0.0f), im(8, 0.0f);
        re[0] = 1.0f;
        diar::fft_radix2(re, im);
        for (int i = 0; i < 8; ++i) {
            assert(near(re[i], 1.0, 1e-5));
            assert(near(im[i], 0.0, 1e-5));
        }
    }

    // Mel features: frame count and shape
    {
        diar::MelFeatureExtractor mel;
        assert(mel.fft_size() == 512);
        assert(mel.n_mels() == 80);
        assert(mel.get_num_frames(399) == 0);
        assert(mel.get_num_frames(400) == 1);
        assert(mel.get_num_frames(16000) == 98);
        std::vector<float> tone(16000);
        for (size_t i = 0; i < tone.size(); ++i) tone[i] = 0.5f * std::sin(2.0 * M_PI * 440.0 * i / 16000.0);
        auto feats = mel.extract_features(tone.data(), static_cast<int>(tone.size()));
        assert(feats.size() == 98u * 80u);
        for (float v : feats) assert(std::isfinite(v));
        assert(mel.extract_features(tone.data(), 100).empty());
    }

    // Window labels and merging
    {
        using diar::OnnxDiarizer;
        assert(OnnxDiarizer::label_for(0) == "A");
        assert(OnnxDiarizer::label_for(25) == "Z");
        assert(OnnxDiarizer::label_for(26) == "AA");

        std::vector<int16_t> silence(1600, 0);
        assert(OnnxDiarizer::rms_dbfs(silence.data(), silence.size()) <= -120.0);
        std::vector<int16_t> loud(1600, 16384);
        assert(near(OnnxDiarizer::rms_dbfs(loud.data(), loud.size()), 20.0 * std::log10(0.5), 1e-3));

        std::vector<OnnxDiarizer::WindowLabel> windows = {
            {0, 0.0, 1.5}, {0, 0.75, 2.25}, {1, 1.5, 3.0}, {-1, 2.25, 3.75}, {1, 3.0, 4.5}, {0, 3.75, 5.0},
        };
        auto intervals = OnnxDiarizer::merge_windows(windows, 0.75);
        assert(intervals.size() == 4);
        assert(intervals[0].speaker_label == "A" && near(intervals[0].start, 0.0) && near(intervals[0].end, 1.5));
        assert(intervals[1].speaker_label == "B" && near(intervals[1].end, 2.25));
        // The silent window leaves a gap, so speaker B opens a second interval
        assert(intervals[2].speaker_label == "B" && near(intervals[2].start, 3.0) && near(intervals[2].end, 3.75));
        // The last window owns up to its end
        assert(intervals[3].speaker_label == "A" && near(intervals[3].end, 5.0));
    }

    // Without a loadable model the diarizer reports itself unavailable
    {
        diar::OnnxDiarizer::Config cfg;
        cfg.model_path = "/nonexistent/speaker.onnx";
        diar::OnnxDiarizer diarizer(cfg);
        assert(!diarizer.available());
        auto r = diarizer.diarize("/nonexistent/audio.wav");
        assert(!r.ok());
        assert(r.error().kind == core::ErrorKind::DiarizationUnavailable);
    }
    return 0;
}
