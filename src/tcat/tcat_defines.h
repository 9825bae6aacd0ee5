/*
 * Copyright (C) 2005-2009 by Pieter Palmers
 *
 * This file is part of FFADO
 * FFADO = Free Firewire (pro-)audio drivers for linux
 *
 * FFADO is based upon FreeBoB
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 2 of the License, or
 * (at your option) version 3 of the License.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef TCAT_DEFINES_H
#define TCAT_DEFINES_H

#define TCAT_VER_MAJOR 0
#define TCAT_VER_MINOR 1

#define TCAT_DEFAULT_TIMEOUT_MS         100

// all offsets below are relative to this address
#define TCAT_REGISTER_BASE              0x0000FFFFE0000000ULL

// asynchronous requests are split into frames of this size
#define TCAT_MAX_FRAME_BYTES            512
#define TCAT_MAX_FRAME_QUADS            (TCAT_MAX_FRAME_BYTES/4)

#define TCAT_INVALID_OFFSET             0xFFFFFFFFFFFFFFFFULL

// general section descriptors, offset and size in quadlets
#define TCAT_REGISTER_GLOBAL_PAR_SPACE_OFF      0x0000
#define TCAT_REGISTER_GLOBAL_PAR_SPACE_SZ       0x0004
#define TCAT_REGISTER_TX_PAR_SPACE_OFF          0x0008
#define TCAT_REGISTER_TX_PAR_SPACE_SZ           0x000C
#define TCAT_REGISTER_RX_PAR_SPACE_OFF          0x0010
#define TCAT_REGISTER_RX_PAR_SPACE_SZ           0x0014
#define TCAT_REGISTER_EXT_SYNC_SPACE_OFF        0x0018
#define TCAT_REGISTER_EXT_SYNC_SPACE_SZ         0x001C
#define TCAT_REGISTER_RESERVED_SPACE_OFF        0x0020
#define TCAT_REGISTER_RESERVED_SPACE_SZ         0x0024
#define TCAT_GENERAL_SECTIONS_SIZE              0x0028

// global section
#define TCAT_REGISTER_GLOBAL_OWNER              0x0000
#define TCAT_REGISTER_GLOBAL_NOTIFICATION       0x0008
#define TCAT_REGISTER_GLOBAL_NICK_NAME          0x000C
#define TCAT_REGISTER_GLOBAL_CLOCK_SELECT       0x004C
#define TCAT_REGISTER_GLOBAL_ENABLE             0x0050
#define TCAT_REGISTER_GLOBAL_STATUS             0x0054
#define TCAT_REGISTER_GLOBAL_EXTENDED_STATUS    0x0058
#define TCAT_REGISTER_GLOBAL_SAMPLE_RATE        0x005C
#define TCAT_REGISTER_GLOBAL_VERSION            0x0060
#define TCAT_REGISTER_GLOBAL_CLOCKCAPABILITIES  0x0064
#define TCAT_REGISTER_GLOBAL_CLOCKSOURCENAMES   0x0068

#define TCAT_NICK_NAME_SIZE                     64
#define TCAT_CLOCKSOURCENAMES_SIZE              256
// sections not larger than this carry neither caps nor source names
#define TCAT_GLOBAL_LEGACY_SIZE                 96

#define TCAT_CLOCK_SELECT_SOURCE_MASK           0x000000FF
#define TCAT_CLOCK_SELECT_RATE_MASK             0x0000FF00
#define TCAT_CLOCK_SELECT_RATE_SHIFT            8

#define TCAT_STATUS_SOURCE_LOCKED               0x00000001
#define TCAT_STATUS_NOMINAL_RATE_MASK           0x0000FF00
#define TCAT_STATUS_NOMINAL_RATE_SHIFT          8

#define TCAT_EXT_STATUS_LOCKED_MASK             0x0000FFFF
#define TCAT_EXT_STATUS_SLIPPED_MASK            0xFFFF0000
#define TCAT_EXT_STATUS_SLIPPED_SHIFT           16

#define TCAT_CLOCKCAP_RATE_MASK                 0x0000FFFF
#define TCAT_CLOCKCAP_SOURCE_MASK               0xFFFF0000
#define TCAT_CLOCKCAP_SOURCE_SHIFT              16

// notification bits
#define TCAT_NOTIFY_RX_CFG_CHG                  0x00000001
#define TCAT_NOTIFY_TX_CFG_CHG                  0x00000002
#define TCAT_NOTIFY_LOCK_CHG                    0x00000010
#define TCAT_NOTIFY_CLOCK_ACCEPTED              0x00000020
#define TCAT_NOTIFY_EXT_STATUS                  0x00000040
#define TCAT_NOTIFY_CLOCK_MASK  (TCAT_NOTIFY_LOCK_CHG | TCAT_NOTIFY_CLOCK_ACCEPTED | TCAT_NOTIFY_EXT_STATUS)

// tx/rx stream format sections
#define TCAT_REGISTER_TX_NB_TX                  0x0000
#define TCAT_REGISTER_TX_SZ_TX                  0x0004
#define TCAT_REGISTER_TX_PARAMETER_SPACE        0x0008
#define TCAT_REGISTER_TX_ISOC_BASE              0x0000
#define TCAT_REGISTER_TX_NB_AUDIO_BASE          0x0004
#define TCAT_REGISTER_TX_MIDI_BASE              0x0008
#define TCAT_REGISTER_TX_SPEED_BASE             0x000C
#define TCAT_REGISTER_TX_NAMES_BASE             0x0010

#define TCAT_REGISTER_RX_NB_RX                  0x0000
#define TCAT_REGISTER_RX_SZ_RX                  0x0004
#define TCAT_REGISTER_RX_PARAMETER_SPACE        0x0008
#define TCAT_REGISTER_RX_ISOC_BASE              0x0000
#define TCAT_REGISTER_RX_SEQ_START_BASE         0x0004
#define TCAT_REGISTER_RX_NB_AUDIO_BASE          0x0008
#define TCAT_REGISTER_RX_MIDI_BASE              0x000C
#define TCAT_REGISTER_RX_NAMES_BASE             0x0010

#define TCAT_REGISTER_TX_AC3_CAPS_BASE          0x0110
#define TCAT_REGISTER_TX_AC3_ENABLE_BASE        0x0114
#define TCAT_REGISTER_RX_AC3_CAPS_BASE          0x0110
#define TCAT_REGISTER_RX_AC3_ENABLE_BASE        0x0114

#define TCAT_STREAM_NAMES_SIZE                  256
// older firmware stops after the names
#define TCAT_STREAM_ENTRY_MIN_SIZE              0x0110
#define TCAT_STREAM_ENTRY_AC3_SIZE              0x0118

// extension (EAP) space
#define TCAT_EAP_BASE                           0x0000000000200000ULL
#define TCAT_EAP_MAX_SIZE                       0x0000000000F00000ULL

#define TCAT_EAP_CAPABILITY_SPACE_OFF           0x0000
#define TCAT_EAP_CMD_SPACE_OFF                  0x0008
#define TCAT_EAP_MIXER_SPACE_OFF                0x0010
#define TCAT_EAP_PEAK_SPACE_OFF                 0x0018
#define TCAT_EAP_NEW_ROUTING_SPACE_OFF          0x0020
#define TCAT_EAP_NEW_STREAM_CFG_SPACE_OFF       0x0028
#define TCAT_EAP_CURR_CFG_SPACE_OFF             0x0030
#define TCAT_EAP_STAND_ALONE_CFG_SPACE_OFF      0x0038
#define TCAT_EAP_APP_SPACE_OFF                  0x0040
#define TCAT_EAP_ZERO_MARKER_1                  0x0048
#define TCAT_EAP_SECTIONS_SIZE                  0x0048

// capability registers
#define TCAT_EAP_CAPABILITY_ROUTER              0x0000
#define TCAT_EAP_CAPABILITY_MIXER               0x0004
#define TCAT_EAP_CAPABILITY_GENERAL             0x0008
#define TCAT_EAP_CAPABILITY_RESERVED            0x000C

// bit positions inside the capability registers
#define TCAT_EAP_CAP_ROUTER_EXPOSED             0
#define TCAT_EAP_CAP_ROUTER_READONLY            1
#define TCAT_EAP_CAP_ROUTER_FLASHSTORED         2
#define TCAT_EAP_CAP_ROUTER_MAXROUTES           16

#define TCAT_EAP_CAP_MIXER_EXPOSED              0
#define TCAT_EAP_CAP_MIXER_READONLY             1
#define TCAT_EAP_CAP_MIXER_FLASHSTORED          2
#define TCAT_EAP_CAP_MIXER_IN_DEV               4
#define TCAT_EAP_CAP_MIXER_OUT_DEV              8
#define TCAT_EAP_CAP_MIXER_INPUTS               16
#define TCAT_EAP_CAP_MIXER_OUTPUTS              24

#define TCAT_EAP_CAP_GENERAL_STRM_CFG_EN        0
#define TCAT_EAP_CAP_GENERAL_FLASH_EN           1
#define TCAT_EAP_CAP_GENERAL_PEAK_EN            2
#define TCAT_EAP_CAP_GENERAL_MAX_TX_STREAM      4
#define TCAT_EAP_CAP_GENERAL_MAX_RX_STREAM      8
#define TCAT_EAP_CAP_GENERAL_STRM_CFG_FLS       12
#define TCAT_EAP_CAP_GENERAL_CHIP               16

#define TCAT_EAP_CAP_GENERAL_CHIP_DICEII        0
#define TCAT_EAP_CAP_GENERAL_CHIP_TCD2210       1
#define TCAT_EAP_CAP_GENERAL_CHIP_TCD2220       2

// command section
#define TCAT_EAP_COMMAND_OPCODE                 0x0000
#define TCAT_EAP_COMMAND_RETVAL                 0x0004

#define TCAT_EAP_CMD_OPCODE_NO_OP               0x0000
#define TCAT_EAP_CMD_OPCODE_LD_ROUTER           0x0001
#define TCAT_EAP_CMD_OPCODE_LD_STRM_CFG         0x0002
#define TCAT_EAP_CMD_OPCODE_LD_RTR_STRM_CFG     0x0003
#define TCAT_EAP_CMD_OPCODE_LD_FLASH_CFG        0x0004
#define TCAT_EAP_CMD_OPCODE_ST_FLASH_CFG        0x0005

#define TCAT_EAP_CMD_OPCODE_FLAG_LD_LOW         (1U<<16)
#define TCAT_EAP_CMD_OPCODE_FLAG_LD_MID         (1U<<17)
#define TCAT_EAP_CMD_OPCODE_FLAG_LD_HIGH        (1U<<18)
#define TCAT_EAP_CMD_OPCODE_FLAG_LD_EXECUTE     (1U<<31)

// completion of a command is polled once per millisecond
#define TCAT_EAP_CMD_MAX_WAIT_MS                100

// mixer section
#define TCAT_EAP_MIXER_SATURATION               0x0000
#define TCAT_EAP_MIXER_COEFFICIENTS             0x0004
#define TCAT_EAP_MIXER_MAX_OUTPUTS              16
#define TCAT_EAP_MIXER_MAX_INPUTS               18

// router section
#define TCAT_EAP_ROUTER_NB_ENTRIES              0x0000
#define TCAT_EAP_ROUTER_ENTRIES                 0x0004
#define TCAT_EAP_ROUTER_MAX_ENTRIES             128

#define TCAT_EAP_ROUTER_ENTRY_DST_MASK          0x000000FF
#define TCAT_EAP_ROUTER_ENTRY_SRC_MASK          0x0000FF00
#define TCAT_EAP_ROUTER_ENTRY_SRC_SHIFT         8
#define TCAT_EAP_ROUTER_ENTRY_PEAK_MASK         0xFFFF0000
#define TCAT_EAP_ROUTER_ENTRY_PEAK_SHIFT        16

// stream format section
#define TCAT_EAP_STREAM_NB_TX                   0x0000
#define TCAT_EAP_STREAM_NB_RX                   0x0004
#define TCAT_EAP_STREAM_ENTRIES                 0x0008
#define TCAT_EAP_STREAM_ENTRY_SIZE              268
#define TCAT_EAP_STREAM_ENTRY_PCM               0x0000
#define TCAT_EAP_STREAM_ENTRY_MIDI              0x0004
#define TCAT_EAP_STREAM_ENTRY_NAMES             0x0008
#define TCAT_EAP_STREAM_ENTRY_AC3               0x0108
#define TCAT_EAP_AC3_CHANNELS                   32

// current configuration section
#define TCAT_EAP_CURRCFG_LOW_ROUTER             0x0000
#define TCAT_EAP_CURRCFG_LOW_STREAM             0x1000
#define TCAT_EAP_CURRCFG_MID_ROUTER             0x2000
#define TCAT_EAP_CURRCFG_MID_STREAM             0x3000
#define TCAT_EAP_CURRCFG_HIGH_ROUTER            0x4000
#define TCAT_EAP_CURRCFG_HIGH_STREAM            0x5000

// standalone section
#define TCAT_EAP_STANDALONE_CLOCK_SRC           0x0000
#define TCAT_EAP_STANDALONE_AES_HIGH_RATE       0x0004
#define TCAT_EAP_STANDALONE_ADAT_MODE           0x0008
#define TCAT_EAP_STANDALONE_WORD_CLOCK          0x000C
#define TCAT_EAP_STANDALONE_INTERNAL_RATE       0x0010
#define TCAT_EAP_STANDALONE_SIZE                0x0014

#define TCAT_EAP_STANDALONE_WC_MODE_MASK        0x00000003
#define TCAT_EAP_STANDALONE_WC_NUM_MASK         0x0000FFF0
#define TCAT_EAP_STANDALONE_WC_NUM_SHIFT        4
#define TCAT_EAP_STANDALONE_WC_DEN_MASK         0xFFFF0000
#define TCAT_EAP_STANDALONE_WC_DEN_SHIFT        16

// block addresses inside router entries
#define TCAT_BLK_ID_MASK                        0xF0
#define TCAT_BLK_ID_SHIFT                       4
#define TCAT_BLK_CH_MASK                        0x0F
#define TCAT_BLK_UNASSIGNED                     0xFF

#endif // TCAT_DEFINES_H
