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

#if HAVE_CONFIG_H
#include <config.h>
#endif /* HAVE_CONFIG_H */

#include <gst/gst.h>

#include "gst_engine.hh"
#include "error.hh"
#include "messages.h"

static GstState to_gst_state(Player::State state)
{
    switch(state)
    {
      case Player::State::NULL_STATE:
        return GST_STATE_NULL;

      case Player::State::READY:
        return GST_STATE_READY;

      case Player::State::PAUSED:
        return GST_STATE_PAUSED;

      case Player::State::PLAYING:
        return GST_STATE_PLAYING;
    }

    return GST_STATE_NULL;
}

static void change_state_or_throw(GstElement *element, Player::State state)
{
    const GstStateChangeReturn ret =
        gst_element_set_state(element, to_gst_state(state));

    if(ret == GST_STATE_CHANGE_FAILURE)
        throw Error::Error(Error::Code::PIPELINE_STATE,
                           std::string("Failed setting pipeline state to ") +
                           Player::state_to_string(state));

    msg_vinfo(MESSAGE_LEVEL_DEBUG, "Pipeline state change to %s: %s",
              Player::state_to_string(state),
              gst_element_state_change_return_get_name(ret));
}

static GstElement *make_element(const char *factory_name)
{
    GstElement *element = gst_element_factory_make(factory_name, nullptr);

    if(element == nullptr)
        throw Error::Error(Error::Code::PIPELINE_ELEMENT,
                           std::string("Failed creating element \"") +
                           factory_name + "\"");

    return element;
}

static gboolean bus_message_handler(GstBus *bus, GstMessage *message,
                                    gpointer user_data)
{
    const auto *const engine = static_cast<const Player::GstEngine *>(user_data);

    switch(GST_MESSAGE_TYPE(message))
    {
      case GST_MESSAGE_EOS:
        msg_vinfo(MESSAGE_LEVEL_DIAG, "End of stream");
        engine->bus_end_of_stream();
        break;

      case GST_MESSAGE_ERROR:
        {
            GError *error = nullptr;
            gchar *debug = nullptr;
            gst_message_parse_error(message, &error, &debug);

            msg_error(0, LOG_ERR, "Pipeline error from %s: %s (%s)",
                      GST_OBJECT_NAME(GST_MESSAGE_SRC(message)),
                      error != nullptr ? error->message : "unknown error",
                      debug != nullptr ? debug : "no debug information");

            const std::string text(error != nullptr ? error->message : "unknown error");

            g_clear_error(&error);
            g_free(debug);

            engine->bus_error(text);
        }

        break;

      case GST_MESSAGE_WARNING:
        {
            GError *error = nullptr;
            gchar *debug = nullptr;
            gst_message_parse_warning(message, &error, &debug);

            msg_error(0, LOG_WARNING, "Pipeline warning from %s: %s (%s)",
                      GST_OBJECT_NAME(GST_MESSAGE_SRC(message)),
                      error != nullptr ? error->message : "unknown warning",
                      debug != nullptr ? debug : "no debug information");

            g_clear_error(&error);
            g_free(debug);
        }

        break;

      case GST_MESSAGE_STATE_CHANGED:
        if(msg_is_verbose(MESSAGE_LEVEL_DEBUG) &&
           GST_IS_PIPELINE(GST_MESSAGE_SRC(message)))
        {
            GstState old_state;
            GstState new_state;
            gst_message_parse_state_changed(message, &old_state, &new_state, nullptr);
            msg_vinfo(MESSAGE_LEVEL_DEBUG, "Pipeline state %s -> %s",
                      gst_element_state_get_name(old_state),
                      gst_element_state_get_name(new_state));
        }

        break;

      default:
        break;
    }

    return G_SOURCE_CONTINUE;
}

static bool is_audio_pad(GstPad *pad)
{
    GstCaps *caps = gst_pad_get_current_caps(pad);

    if(caps == nullptr)
        caps = gst_pad_query_caps(pad, nullptr);

    if(caps == nullptr)
        return false;

    bool result = false;

    if(gst_caps_get_size(caps) > 0)
    {
        const GstStructure *s = gst_caps_get_structure(caps, 0);
        result = g_str_has_prefix(gst_structure_get_name(s), "audio/");
    }

    gst_caps_unref(caps);

    return result;
}

static void build_output_chain(GstElement *pipeline, GstPad *src_pad,
                               const std::string &sink_name)
{
    GstElement *convert = make_element("audioconvert");
    GstElement *resample = nullptr;
    GstElement *sink = nullptr;

    try
    {
        resample = make_element("audioresample");
        sink = make_element(sink_name.c_str());
    }
    catch(...)
    {
        gst_object_unref(convert);

        if(resample != nullptr)
            gst_object_unref(resample);

        throw;
    }

    gst_bin_add_many(GST_BIN(pipeline), convert, resample, sink, nullptr);

    if(!gst_element_link_many(convert, resample, sink, nullptr))
        throw Error::Error(Error::Code::PIPELINE_LINK,
                           "Failed linking audio output chain");

    GstPad *sink_pad = gst_element_get_static_pad(convert, "sink");
    const GstPadLinkReturn ret = gst_pad_link(src_pad, sink_pad);
    gst_object_unref(sink_pad);

    if(GST_PAD_LINK_FAILED(ret))
        throw Error::Error(Error::Code::PIPELINE_LINK,
                           std::string("Failed linking decoder to output: ") +
                           gst_pad_link_get_name(ret));

    if(!gst_element_sync_state_with_parent(convert) ||
       !gst_element_sync_state_with_parent(resample) ||
       !gst_element_sync_state_with_parent(sink))
        throw Error::Error(Error::Code::PIPELINE_STATE,
                           "Failed starting audio output chain");

    msg_vinfo(MESSAGE_LEVEL_DIAG, "Audio output chain linked");
}

static void decodebin_pad_added(GstElement *decodebin, GstPad *pad,
                                gpointer user_data)
{
    const auto *const engine = static_cast<const Player::GstEngine *>(user_data);

    if(!is_audio_pad(pad))
    {
        msg_vinfo(MESSAGE_LEVEL_DEBUG, "Ignoring non-audio pad %s",
                  GST_PAD_NAME(pad));
        return;
    }

    GstElement *pipeline = GST_ELEMENT(gst_element_get_parent(decodebin));

    if(pipeline == nullptr)
    {
        msg_error(0, LOG_ERR, "Decoder has no parent");
        return;
    }

    try
    {
        build_output_chain(pipeline, pad, engine->get_audio_sink_name());
    }
    catch(const Error::Error &e)
    {
        msg_error(0, LOG_ERR, "%s (%s)", e.what(), Error::code_to_string(e.get()));
        engine->bus_error(e.what());
    }

    gst_object_unref(pipeline);
}

Player::GstEngine::GstEngine(Stream::ResolverIface &resolver,
                             std::string &&audio_sink_name,
                             EndOfStreamFn &&end_of_stream_fn,
                             PipelineErrorFn &&pipeline_error_fn):
    resolver_(resolver),
    audio_sink_name_(std::move(audio_sink_name)),
    pipeline_(gst_pipeline_new("rosesong")),
    bus_watch_(0),
    end_of_stream_fn_(std::move(end_of_stream_fn)),
    pipeline_error_fn_(std::move(pipeline_error_fn))
{
    if(pipeline_ == nullptr)
        throw Error::Error(Error::Code::INIT, "Failed creating pipeline");

    GstBus *bus = gst_pipeline_get_bus(GST_PIPELINE(pipeline_));
    bus_watch_ = gst_bus_add_watch(bus, bus_message_handler, this);
    gst_object_unref(bus);
}

Player::GstEngine::~GstEngine()
{
    gst_element_set_state(pipeline_, GST_STATE_NULL);

    if(bus_watch_ != 0)
        g_source_remove(bus_watch_);

    gst_object_unref(pipeline_);
}

void Player::GstEngine::bus_end_of_stream() const
{
    if(end_of_stream_fn_ != nullptr)
        end_of_stream_fn_();
}

void Player::GstEngine::bus_error(const std::string &message) const
{
    if(pipeline_error_fn_ != nullptr)
        pipeline_error_fn_(message);
}

void Player::GstEngine::clear_pipeline()
{
    gst_element_set_state(pipeline_, GST_STATE_NULL);

    GstBin *bin = GST_BIN(pipeline_);

    while(true)
    {
        GST_OBJECT_LOCK(bin);
        GList *children = GST_BIN_CHILDREN(bin);
        GstElement *child = children != nullptr
            ? GST_ELEMENT(gst_object_ref(children->data))
            : nullptr;
        GST_OBJECT_UNLOCK(bin);

        if(child == nullptr)
            break;

        gst_element_set_state(child, GST_STATE_NULL);
        gst_bin_remove(bin, child);
        gst_object_unref(child);
    }
}

void Player::GstEngine::build_source(const std::string &url)
{
    const auto &params(resolver_.get_parameters());

    GstElement *source = make_element("souphttpsrc");
    GstElement *decodebin = nullptr;

    try
    {
        decodebin = make_element("decodebin");
    }
    catch(...)
    {
        gst_object_unref(source);
        throw;
    }

    GstStructure *headers =
        gst_structure_new("headers",
                          "Referer", G_TYPE_STRING, params.referer_.c_str(),
                          nullptr);

    g_object_set(source,
                 "location", url.c_str(),
                 "user-agent", params.user_agent_.c_str(),
                 "extra-headers", headers,
                 nullptr);

    gst_structure_free(headers);

    gst_bin_add_many(GST_BIN(pipeline_), source, decodebin, nullptr);

    if(!gst_element_link(source, decodebin))
        throw Error::Error(Error::Code::PIPELINE_LINK,
                           "Failed linking source to decoder");

    g_signal_connect(decodebin, "pad-added",
                     G_CALLBACK(decodebin_pad_added), this);
}

void Player::GstEngine::play_track(const Playlist::Track &track)
{
    msg_info("Playing %s", track.get_description().c_str());

    try
    {
        clear_pipeline();
        change_state_or_throw(pipeline_, State::READY);

        const std::string url(resolver_.resolve(track.bvid_, track.cid_));

        build_source(url);
        change_state_or_throw(pipeline_, State::PLAYING);
    }
    catch(...)
    {
        clear_pipeline();
        throw;
    }
}

void Player::GstEngine::set_state(State state)
{
    change_state_or_throw(pipeline_, state);
}
