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

#include <iostream>
#include <thread>
#include <cstring>
#include <cerrno>
#include <csignal>
#include <unistd.h>

#include <glib.h>
#include <glib-unix.h>
#include <gst/gst.h>

#include "configuration_rosesong.hh"
#include "curl_client.hh"
#include "stream_resolver.hh"
#include "gst_engine.hh"
#include "playlist_file.hh"
#include "dispatcher.hh"
#include "dbus_iface.h"
#include "dbus_handlers.hh"
#include "main_context.hh"
#include "error.hh"
#include "messages.h"
#include "messages_glib.h"
#include "os.h"

struct parameters
{
    enum MessageVerboseLevel verbose_level;
    bool run_in_foreground;
    bool connect_to_session_dbus;
    const char *config_file;
    const char *playlist_file;
};

struct files_t
{
    std::string base_dir;
    std::string playlists_dir;
    std::string config_file;
    std::string playlist_file;
};

static void show_version_info(void)
{
    printf("%s\n", PACKAGE_STRING);
}

static void log_version_info(void)
{
    msg_vinfo(MESSAGE_LEVEL_IMPORTANT, "Rosesong %s", PACKAGE_VERSION);
}

static void determine_file_names(const struct parameters *parameters,
                                 struct files_t *files)
{
    files->base_dir = g_get_home_dir();
    files->base_dir += "/.config/rosesong";
    files->playlists_dir = files->base_dir + "/playlists";

    if(parameters->config_file != nullptr)
        files->config_file = parameters->config_file;
    else
        files->config_file = files->base_dir + "/rosesong.ini";

    if(parameters->playlist_file != nullptr)
        files->playlist_file = parameters->playlist_file;
    else
        files->playlist_file = files->playlists_dir + "/playlist.json";
}

static int create_files(const struct files_t *files)
{
    if(!os_mkdir_hierarchy(files->playlists_dir.c_str()))
        return -1;

    if(!os_touch_file_if_missing(files->playlist_file.c_str()))
        return -1;

    return 0;
}

/*!
 * Set up logging, daemonize, initialize libraries.
 */
static int setup(const struct parameters *parameters,
                 const struct files_t *files, GMainLoop **loop)
{
    msg_enable_syslog(!parameters->run_in_foreground);
    msg_enable_glib_message_redirection();
    msg_set_verbose_level(parameters->verbose_level);

    if(!parameters->run_in_foreground)
        openlog("rosesongd", LOG_PID, LOG_DAEMON);

    if(!parameters->run_in_foreground)
    {
        if(daemon(0, 0) < 0)
        {
            msg_error(errno, LOG_EMERG, "Failed to run as daemon");
            return -1;
        }
    }

    log_version_info();

    if(create_files(files) < 0)
        return -1;

    GError *error = nullptr;

    if(!gst_init_check(nullptr, nullptr, &error))
    {
        msg_error(0, LOG_EMERG, "Failed initializing GStreamer: %s",
                  error != nullptr ? error->message : "unknown error");
        g_clear_error(&error);
        return -1;
    }

    if(!Net::CurlClient::global_init())
        goto error_curl_init;

    *loop = g_main_loop_new(NULL, FALSE);
    if(*loop == NULL)
    {
        msg_error(ENOMEM, LOG_EMERG, "Failed creating GLib main loop");
        goto error_main_loop_new;
    }

    return 0;

error_main_loop_new:
    Net::CurlClient::global_cleanup();

error_curl_init:
    gst_deinit();
    return -1;
}

static void usage(const char *program_name)
{
    std::cout <<
        "Usage: " << program_name << " [options]\n"
        "\n"
        "Options:\n"
        "  --help          Show this help.\n"
        "  --version       Print version information to stdout.\n"
        "  --verbose lvl   Set verbosity level to given level.\n"
        "  --quiet         Short for \"--verbose quite\".\n"
        "  --fg            Run in foreground, don't run as daemon.\n"
        "  --config file   Name of the configuration file.\n"
        "  --playlist file Name of the playlist file.\n"
        "  --session-dbus  Connect to session D-Bus.\n"
        "  --system-dbus   Connect to system D-Bus.\n"
        ;
}

static bool check_argument(int argc, char *argv[], int &i)
{
    if(i + 1 >= argc)
    {
        std::cerr << "Option " << argv[i] << " requires an argument.\n";
        return false;
    }

    ++i;

    return true;
}

static int process_command_line(int argc, char *argv[],
                                struct parameters *parameters)
{
    parameters->verbose_level = MESSAGE_LEVEL_NORMAL;
    parameters->run_in_foreground = false;
    parameters->connect_to_session_dbus = true;
    parameters->config_file = nullptr;
    parameters->playlist_file = nullptr;

    for(int i = 1; i < argc; ++i)
    {
        if(strcmp(argv[i], "--help") == 0)
            return 1;
        else if(strcmp(argv[i], "--version") == 0)
            return 2;
        else if(strcmp(argv[i], "--fg") == 0)
            parameters->run_in_foreground = true;
        else if(strcmp(argv[i], "--verbose") == 0)
        {
            if(!check_argument(argc, argv, i))
                return -1;

            parameters->verbose_level = msg_verbose_level_name_to_level(argv[i]);

            if(parameters->verbose_level == MESSAGE_LEVEL_IMPOSSIBLE)
            {
                fprintf(stderr,
                        "Invalid verbosity \"%s\". "
                        "Valid verbosity levels are:\n", argv[i]);

                const char *const *names = msg_get_verbose_level_names();

                for(const char *name = *names; name != NULL; name = *++names)
                    fprintf(stderr, "    %s\n", name);

                return -1;
            }
        }
        else if(strcmp(argv[i], "--quiet") == 0)
            parameters->verbose_level = MESSAGE_LEVEL_QUIET;
        else if(strcmp(argv[i], "--config") == 0)
        {
            if(!check_argument(argc, argv, i))
                return -1;
            parameters->config_file = argv[i];
        }
        else if(strcmp(argv[i], "--playlist") == 0)
        {
            if(!check_argument(argc, argv, i))
                return -1;
            parameters->playlist_file = argv[i];
        }
        else if(strcmp(argv[i], "--session-dbus") == 0)
            parameters->connect_to_session_dbus = true;
        else if(strcmp(argv[i], "--system-dbus") == 0)
            parameters->connect_to_session_dbus = false;
        else
        {
            std::cerr << "Unknown option \"" << argv[i]
                      << "\". Please try --help.\n";
            return -1;
        }
    }

    return 0;
}

/*!
 * Read playlist for the first time.
 *
 * \returns
 *     True if the daemon should start in idle state.
 */
static bool load_initial_playlist(const std::string &path,
                                  Playlist::Store &store)
{
    try
    {
        store.replace(Playlist::File::load(path));
        return false;
    }
    catch(const Error::Error &e)
    {
        if(e.get() == Error::Code::EMPTY_PLAYLIST)
            msg_info("Playlist is empty, waiting for tracks");
        else
            msg_error(0, LOG_ERR, "Failed loading playlist: %s (%s)",
                      e.what(), Error::code_to_string(e.get()));
    }

    return true;
}

static gboolean signal_handler(gpointer user_data)
{
    g_main_loop_quit(static_cast<GMainLoop *>(user_data));
    return G_SOURCE_REMOVE;
}

static int run(const struct parameters &parameters,
               const struct files_t &files, GMainLoop *loop)
{
    Configuration::RosesongConfigManager
        config_manager(std::string(files.config_file),
                       Configuration::RosesongValues::defaults());
    config_manager.load();

    const auto &config(config_manager.values());

    Net::CurlClient http_client(std::chrono::seconds(config.http_timeout_s_));

    const Retry::Policy retry_policy(
        config.max_fetch_attempts_,
        std::chrono::milliseconds(config.initial_retry_delay_ms_),
        config.retry_backoff_factor_,
        std::chrono::milliseconds(config.max_retry_delay_ms_));

    Stream::Resolver resolver(
        http_client,
        Stream::ResolverParameters(std::string(config.api_base_url_),
                                   std::string(config.user_agent_),
                                   std::string(config.referer_)),
        retry_policy,
        [] (std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); });

    Player::CommandQueue command_queue(config.command_queue_size_);
    Playlist::Store store;

    Player::GstEngine engine(
        resolver, std::string(config.audio_sink_),
        [&command_queue] ()
        {
            command_queue.post_internal(
                Player::Command::make(Player::CommandID::TRACK_FINISHED));
        },
        [&command_queue] (const std::string &message)
        {
            command_queue.post_internal(
                Player::Command::make_pipeline_error(message));
        });

    const bool start_idle = load_initial_playlist(files.playlist_file, store);

    const std::string playlist_file(files.playlist_file);

    Player::Dispatcher dispatcher(
        command_queue, store, engine,
        [&playlist_file] () { return Playlist::File::load(playlist_file); },
        [loop] ()
        {
            MainContext::deferred_call(
                new std::function<void()>([loop] { g_main_loop_quit(loop); }),
                false);
        },
        config.play_mode_, start_idle);

    DBus::HandlerData dbus_handler_data(command_queue);

    if(dbus_setup(loop, parameters.connect_to_session_dbus,
                  &dbus_handler_data) < 0)
        return -1;

    g_unix_signal_add(SIGINT, signal_handler, loop);
    g_unix_signal_add(SIGTERM, signal_handler, loop);

    dispatcher.start();
    command_queue.post_internal(Player::Command::make(Player::CommandID::START));

    g_main_loop_run(loop);

    msg_vinfo(MESSAGE_LEVEL_IMPORTANT, "Shutting down");

    command_queue.shutdown();
    dispatcher.join();

    try
    {
        engine.set_state(Player::State::NULL_STATE);
    }
    catch(const Error::Error &e)
    {
        msg_error(0, LOG_ERR, "Failed stopping pipeline: %s", e.what());
    }

    dbus_shutdown();

    return 0;
}

int main(int argc, char *argv[])
{
    static struct parameters parameters;
    static struct files_t files;

    int ret = process_command_line(argc, argv, &parameters);

    if(ret == -1)
        return EXIT_FAILURE;
    else if(ret == 1)
    {
        usage(argv[0]);
        return EXIT_SUCCESS;
    }
    else if(ret == 2)
    {
        show_version_info();
        return EXIT_SUCCESS;
    }

    determine_file_names(&parameters, &files);

    static GMainLoop *loop = NULL;

    if(setup(&parameters, &files, &loop) < 0)
        return EXIT_FAILURE;

    try
    {
        ret = run(parameters, files, loop);
    }
    catch(const Error::Error &e)
    {
        msg_error(0, LOG_EMERG, "Initialization failed: %s (%s)",
                  e.what(), Error::code_to_string(e.get()));
        ret = -1;
    }

    g_main_loop_unref(loop);
    Net::CurlClient::global_cleanup();
    gst_deinit();

    return ret < 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}
