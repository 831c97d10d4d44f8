/* LV2-Atom: In-place Atom Format
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

#include <lv2/atom/atom.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>
#include <vector>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We try to use a compiled thing or two; and a template (header-only) thing or two;
 * not so much for correctness testing but to see it build successfully and run without barfing.
 * It plays both host and plugin for one processing cycle: the host fills an input port with a few MIDI-ish
 * events and announces an output port buffer; the plugin doubles every Int event and forwards the rest. */
int main()
{
  using lv2::atom::Hash_urid_mapper;
  using lv2::atom::Atom_urid_collection;
  using lv2::atom::Atom_port;
  using lv2::atom::Vec_space;
  using lv2::atom::Sequence;
  using lv2::atom::Chunk;
  using lv2::atom::Int;
  using lv2::atom::Long;
  using lv2::atom::Time_stamp;
  using lv2::Log_component;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Flow_log_component;

  using std::string;
  using std::vector;
  using std::pair;
  using std::exception;

  const string LOG_FILE = "lv2_atom_link_test.log";
  const int BAD_EXIT = 1;
  const size_t PORT_CAPACITY = 256;

  // Same as in any Flow-using program: register the component enums we log with, then make the loggers.
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_to_union_idx_mapping<Log_component>(2000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");
  std_log_config.init_component_names<Log_component>(lv2::S_LV2_LOG_COMPONENT_NAME_MAP, false, "link_test-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the lv2/Flow logging will go into this file.
  FLOW_LOG_INFO("Opening log file [" << LOG_FILE << "] for lv2/Flow logs only.");
  Config log_config = std_log_config;
  log_config.configure_default_verbosity(Sev::S_INFO, true);
  Async_file_logger log_logger(nullptr, &log_config, LOG_FILE, false /* No rotation; we're no serious business. */);

  try
  {
    // Everything below uses the throwing (null `err_code`) forms; any failure lands in the `catch`.
    Hash_urid_mapper mapper(&log_logger);
    const auto urids = Atom_urid_collection::from_map(&mapper).value();

    // Host: the input port holds a frame-stamped sequence.
    Vec_space input(Vec_space::Config{ &log_logger, PORT_CAPACITY });
    {
      auto cursor = input.cursor();
      auto events = cursor.write_atom<Sequence>(urids.m_sequence)->with_frame_unit(urids.m_frame);
      events->new_event<Int>(Time_stamp::frames(0), urids.m_int)->set(42);
      events->new_event<Long>(Time_stamp::frames(1), urids.m_long)->set(17);
      events->new_event<Int>(Time_stamp::frames(2), urids.m_int)->set(3);
    }

    // Host: the output port announces its capacity with a Chunk.
    Vec_space output(Vec_space::Config{ &log_logger, PORT_CAPACITY });
    {
      auto cursor = output.cursor();
      cursor.write_atom<Chunk>(urids.m_chunk)->allocate(PORT_CAPACITY - sizeof(lv2::atom::Atom_header));
    }

    // Plugin: one run() cycle.
    {
      const auto in_port = Atom_port::input_from_raw(&log_logger, input.as_bytes().data(), 0);
      auto out_port = Atom_port::output_from_raw(&log_logger, output.as_bytes_mut().data(), 0);

      const auto in_events = in_port->read<Sequence>(urids.m_sequence)->read(urids.m_frame, urids.m_beat);
      auto out_events = out_port->init<Sequence>(urids.m_sequence)->with_frame_unit(urids.m_frame);
      for (const auto& event : *in_events)
      {
        if (event.second->header().type() == urids.m_int)
        {
          out_events->new_event<Int>(event.first, urids.m_int)->set(*event.second->read<Int>(urids.m_int) * 2);
          continue;
        }
        // else
        out_events->forward(event.first, *event.second);
      }

      FLOW_LOG_INFO("Plugin wrote [" << out_port->written_bytes().size() << "] bytes into the output port.");
    }

    // Host: read back what the plugin wrote.
    auto reader = output.read();
    const auto chunk = reader.next_atom()->read<Chunk>(urids.m_chunk);
    const auto out_port = Atom_port::input_from_raw(&log_logger, chunk->data(), 0);
    vector<pair<int64_t, int64_t>> seen;
    const auto out_events = out_port->read<Sequence>(urids.m_sequence)->read(urids.m_frame, urids.m_beat);
    for (const auto& event : *out_events)
    {
      FLOW_LOG_INFO("Output event at [" << event.first << "]: [" << *event.second << "].");
      seen.emplace_back(*event.first.as_frames(),
                        (event.second->header().type() == urids.m_int)
                          ? int64_t(*event.second->read<Int>(urids.m_int))
                          : int64_t(*event.second->read<Long>(urids.m_long)));
    }

    const vector<pair<int64_t, int64_t>> expected = { { 0, 84 }, { 1, 17 }, { 2, 6 } };
    if (seen != expected)
    {
      FLOW_LOG_WARNING("Output port does not hold the doubled sequence.");
      return BAD_EXIT;
    }

    FLOW_LOG_INFO("Looks good.  Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
