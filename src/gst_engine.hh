/*
 * Copyright (C) 2024  T+A elektroakustik GmbH & Co. KG
 *
 * This file is part of Rosesong.
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA  02110-1301, USA.
 */

#ifndef GST_ENGINE_HH
#define GST_ENGINE_HH

#include <string>
#include <functional>

#include "player_engine.hh"
#include "stream_resolver.hh"

struct _GstElement;

namespace Player
{

/*!
 * Playback engine based on a GStreamer pipeline.
 *
 * The pipeline object lives as long as the engine, its children are
 * replaced for each track.
 */
class GstEngine: public EngineIface
{
  public:
    /*!
     * Notifications from the pipeline bus, called from main loop context.
     */
    using EndOfStreamFn = std::function<void()>;
    using PipelineErrorFn = std::function<void(const std::string &message)>;

  private:
    Stream::ResolverIface &resolver_;
    const std::string audio_sink_name_;

    struct _GstElement *pipeline_;
    unsigned int bus_watch_;

    EndOfStreamFn end_of_stream_fn_;
    PipelineErrorFn pipeline_error_fn_;

  public:
    GstEngine(const GstEngine &) = delete;
    GstEngine &operator=(const GstEngine &) = delete;

    /*!
     * \throws Error::Error
     *     With code #Error::Code::INIT if the pipeline cannot be created.
     */
    explicit GstEngine(Stream::ResolverIface &resolver,
                       std::string &&audio_sink_name,
                       EndOfStreamFn &&end_of_stream_fn,
                       PipelineErrorFn &&pipeline_error_fn);

    ~GstEngine();

    void play_track(const Playlist::Track &track) final override;
    void set_state(State state) final override;

    /*!
     * For the GStreamer bus watch and signal handlers.
     */
    void bus_end_of_stream() const;
    void bus_error(const std::string &message) const;
    const std::string &get_audio_sink_name() const { return audio_sink_name_; }

  private:
    void clear_pipeline();
    void build_source(const std::string &url);
};

}

#endif /* !GST_ENGINE_HH */
