#undef NDEBUG
#include <cassert>
#include <optional>
#include <string>
#include <vector>
#include "diar/speaker_segmenter.hpp"

namespace {
core::Word word(const std::string& text, double start, double end, std::optional<std::string> speaker = std::nullopt,
                std::optional<int> channel = std::nullopt) {
    core::Word w;
    w.text = text;
    w.start = start;
    w.end = end;
    w.speaker_id = speaker;
    w.channel_index = channel;
    return w;
}
} // namespace

int main() {
    diar::SpeakerSegmenter segmenter;

    // Speaker change and long silence both open a turn
    {
        std::vector<core::Word> words = {
            word("hello", 0.0, 0.4, "speaker_0"),
            word("there", 0.5, 0.9, "speaker_0"),
            word("hi", 1.0, 1.5, "speaker_1"),
            word("again", 3.0, 3.5, "speaker_1"),
        };
        auto turns = segmenter.segment(words);
        assert(turns.size() == 3);
        assert(turns[0].speaker_id == "speaker_0" && turns[0].text == "hello there");
        assert(turns[0].start == 0.0 && turns[0].end == 0.9);
        assert(turns[1].speaker_id == "speaker_1" && turns[1].text == "hi");
        assert(turns[2].text == "again" && turns[2].start == 3.0);
    }

    // A short same-speaker turn after a gap folds into the previous one
    {
        std::vector<core::Word> words = {
            word("long", 0.0, 1.0, "speaker_0"),
            word("yes", 2.0, 2.1, "speaker_0"),
        };
        auto turns = segmenter.segment(words);
        assert(turns.size() == 1);
        assert(turns[0].text == "long yes");
        assert(turns[0].end == 2.1);
    }

    // Short turns of another speaker are kept
    {
        std::vector<core::Word> words = {
            word("long", 0.0, 1.0, "speaker_0"),
            word("mm", 1.1, 1.2, "speaker_1"),
        };
        assert(segmenter.segment(words).size() == 2);
    }

    // Without speaker ids the channel identifies the speaker
    {
        std::vector<core::Word> words = {
            word("left", 0.0, 0.5, std::nullopt, 0),
            word("right", 0.6, 1.2, std::nullopt, 1),
        };
        auto turns = segmenter.segment(words);
        assert(turns.size() == 2);
        assert(turns[0].speaker_id == "channel_0");
        assert(turns[1].speaker_id == "channel_1");
        assert(turns[1].channel_index && *turns[1].channel_index == 1);
    }

    // Unlabeled words share the default speaker; events and empty words are skipped
    {
        core::Word laugh = word("(laughter)", 0.5, 0.6);
        laugh.kind = core::Word::Kind::Event;
        std::vector<core::Word> words = {word("one", 0.0, 0.4), laugh, word("", 0.6, 0.7), word("two", 0.7, 1.0)};
        auto turns = segmenter.segment(words);
        assert(turns.size() == 1);
        assert(turns[0].speaker_id == core::kDefaultSpeaker);
        assert(turns[0].text == "one two");
    }

    assert(segmenter.segment({}).empty());

    // Merge disabled keeps micro-turns
    {
        diar::SpeakerSegmenter::Config cfg;
        cfg.min_merge_ms = 0;
        diar::SpeakerSegmenter no_merge(cfg);
        std::vector<core::Word> words = {word("long", 0.0, 1.0, "a"), word("yes", 2.0, 2.1, "a")};
        assert(no_merge.segment(words).size() == 2);
    }

    // Streaming gives the same turns as the batch pass
    {
        std::vector<core::Word> words = {
            word("a1", 0.0, 0.5, "A"), word("a2", 0.6, 1.0, "A"),
            word("b1", 1.1, 1.6, "B"),
            word("a3", 1.7, 2.4, "A"),
            word("a4", 4.0, 4.1, "A"),
            word("b2", 4.2, 5.0, "B"),
        };
        diar::SpeakerSegmenter streaming;
        std::vector<core::SpeakerTurn> streamed;
        for (const auto& w : words) {
            streaming.push(w);
            for (auto& t : streaming.take_closed()) streamed.push_back(t);
        }
        for (auto& t : streaming.finish()) streamed.push_back(t);

        auto batch = segmenter.segment(words);
        assert(streamed.size() == batch.size());
        for (size_t i = 0; i < batch.size(); ++i) {
            assert(streamed[i].speaker_id == batch[i].speaker_id);
            assert(streamed[i].text == batch[i].text);
            assert(streamed[i].end == batch[i].end);
        }
        assert(batch.size() == 4);
        assert(batch[2].text == "a3 a4");
    }
    return 0;
}
