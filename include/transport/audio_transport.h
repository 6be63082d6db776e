#pragma once

/**
 * @file audio_transport.h
 * @brief Audio transport interface
 *
 * The session layer that carries participants' media. The interpretation
 * core only needs two things from it: playing synthesized audio into one
 * participant's output, and muting/unmuting one participant's raw stream
 * for another (inherited from AudioControlSink).
 */

#include "audio_routing.h"
#include "core/types.h"
#include "errors.h"
#include <string>

namespace polyglot {
namespace transport {

/**
 * @brief Abstract audio transport
 */
class IAudioTransport : public AudioControlSink {
public:
    ~IAudioTransport() override = default;

    /**
     * @brief Play synthesized audio to a participant
     * @param participant_id Listener receiving the audio
     * @param stream_id Outbound stream id; the session marks it as synthesized
     *        so it is never fed back into recognition
     * @param audio PCM samples
     */
    virtual VoidResult play(const std::string& participant_id,
                            const std::string& stream_id,
                            const AudioBuffer& audio) = 0;
};

} // namespace transport
} // namespace polyglot
