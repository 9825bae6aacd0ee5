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

#ifndef TESTS_TCATTESTIMAGE_H
#define TESTS_TCATTESTIMAGE_H

#include "SpyTransport.h"

#include "tcat/tcat_defines.h"
#include "tcat/tcat_protocol.h"

#include <vector>

// general sections, bytes
#define IMG_GLOBAL_OFF          0x0028
#define IMG_GLOBAL_SIZE         0x0168
#define IMG_TX_OFF              0x0190
#define IMG_TX_SIZE             0x0120
#define IMG_RX_OFF              0x02b0
#define IMG_RX_SIZE             0x0120
#define IMG_EXT_SYNC_OFF        0x03d0
#define IMG_EXT_SYNC_SIZE       0x0010

// extension sections, bytes
#define IMG_EAP_CAP_OFF         0x0048
#define IMG_EAP_CAP_SIZE        0x0010
#define IMG_EAP_CMD_OFF         0x0058
#define IMG_EAP_CMD_SIZE        0x0010
#define IMG_EAP_MIXER_OFF       0x0068
#define IMG_EAP_MIXER_SIZE      0x0484
#define IMG_EAP_PEAK_OFF        0x0500
#define IMG_EAP_PEAK_SIZE       0x0200
#define IMG_EAP_ROUTER_OFF      0x0700
#define IMG_EAP_ROUTER_SIZE     0x0204
#define IMG_EAP_STREAM_OFF      0x0a00
#define IMG_EAP_STREAM_SIZE     0x0440
#define IMG_EAP_CURR_OFF        0x1000
#define IMG_EAP_CURR_SIZE       0x6000
#define IMG_EAP_STANDALONE_OFF  0x7000
#define IMG_EAP_STANDALONE_SIZE 0x0014
#define IMG_EAP_APP_OFF         0x7100
#define IMG_EAP_APP_SIZE        0x1000

#define IMG_ROUTER_MAX_ENTRIES  16

/**
 * Register image of a TCD2220 unit with a 16x18 mixer, peak meters and
 * flash storage.
 *
 * The unit runs at 48 kHz from its internal clock and carries one stream
 * of 8 channels per direction at every rate mode.
 */
class TcatTestImage
{
public:
    TcatTestImage( SpyTransport& t )
        : m_t( t )
    {
        setGeneralSections();
        setGlobal( Tcat::eCR_48000, Tcat::eCS_Internal, 48000 );
        setClockCaps( 0x0000007f, 0x10a1 );
        stringlist labels;
        labels.push_back( "S/PDIF" );
        labels.push_back( "unused" );
        labels.push_back( "unused" );
        labels.push_back( "unused" );
        labels.push_back( "unused" );
        labels.push_back( "ADAT" );
        labels.push_back( "unused" );
        labels.push_back( "Word Clock" );
        labels.push_back( "unused" );
        labels.push_back( "unused" );
        labels.push_back( "unused" );
        labels.push_back( "unused" );
        labels.push_back( "Internal" );
        setClockSourceLabels( labels );

        setEapSections();
        setRouterCaps( IMG_ROUTER_MAX_ENTRIES, false );
        setMixerCaps( 16, 18 );
        setGeneralCaps( true );
        m_t.setAutoClear( eapAddr( IMG_EAP_CMD_OFF, TCAT_EAP_COMMAND_OPCODE ),
                          TCAT_EAP_CMD_OPCODE_FLAG_LD_EXECUTE );

        for ( int mode = Tcat::eRM_Low; mode <= Tcat::eRM_High; ++mode ) {
            setCurrentStreams( static_cast<enum Tcat::eRateMode>( mode ), 8, 8 );
        }
    }

    static fb_nodeaddr_t baseAddr( fb_nodeaddr_t offset )
        { return TCAT_REGISTER_BASE + offset; }
    static fb_nodeaddr_t globalAddr( fb_nodeaddr_t offset )
        { return TCAT_REGISTER_BASE + IMG_GLOBAL_OFF + offset; }
    static fb_nodeaddr_t eapAddr( fb_nodeaddr_t section, fb_nodeaddr_t offset )
        { return TCAT_REGISTER_BASE + TCAT_EAP_BASE + section + offset; }

    static fb_nodeaddr_t currentRouterOffset( enum Tcat::eRateMode mode )
    {
        switch ( mode ) {
        case Tcat::eRM_Mid:  return TCAT_EAP_CURRCFG_MID_ROUTER;
        case Tcat::eRM_High: return TCAT_EAP_CURRCFG_HIGH_ROUTER;
        default:             return TCAT_EAP_CURRCFG_LOW_ROUTER;
        }
    }
    static fb_nodeaddr_t currentStreamOffset( enum Tcat::eRateMode mode )
    {
        switch ( mode ) {
        case Tcat::eRM_Mid:  return TCAT_EAP_CURRCFG_MID_STREAM;
        case Tcat::eRM_High: return TCAT_EAP_CURRCFG_HIGH_STREAM;
        default:             return TCAT_EAP_CURRCFG_LOW_STREAM;
        }
    }

    void setGeneralSections()
    {
        const fb_quadlet_t quads[] = {
            IMG_GLOBAL_OFF / 4, IMG_GLOBAL_SIZE / 4,
            IMG_TX_OFF / 4, IMG_TX_SIZE / 4,
            IMG_RX_OFF / 4, IMG_RX_SIZE / 4,
            IMG_EXT_SYNC_OFF / 4, IMG_EXT_SYNC_SIZE / 4,
            0, 0,
        };
        m_t.setBlock( baseAddr( 0 ), quads, sizeof( quads ) / 4 );
    }

    void setGlobal( enum Tcat::eClockRate rate, enum Tcat::eClockSource src,
                    unsigned int current_rate )
    {
        m_t.setQuadlet( globalAddr( TCAT_REGISTER_GLOBAL_CLOCK_SELECT ),
                        src | ( rate << TCAT_CLOCK_SELECT_RATE_SHIFT ) );
        m_t.setQuadlet( globalAddr( TCAT_REGISTER_GLOBAL_STATUS ),
                        TCAT_STATUS_SOURCE_LOCKED | ( rate << TCAT_STATUS_NOMINAL_RATE_SHIFT ) );
        m_t.setQuadlet( globalAddr( TCAT_REGISTER_GLOBAL_SAMPLE_RATE ), current_rate );
        m_t.setQuadlet( globalAddr( TCAT_REGISTER_GLOBAL_VERSION ), 0x01000400 );
    }

    void setClockCaps( fb_quadlet_t rate_bits, fb_quadlet_t src_bits )
    {
        m_t.setQuadlet( globalAddr( TCAT_REGISTER_GLOBAL_CLOCKCAPABILITIES ),
                        rate_bits | ( src_bits << TCAT_CLOCKCAP_SOURCE_SHIFT ) );
    }

    void setClockSourceLabels( const stringlist& labels )
    {
        fb_quadlet_t quads[TCAT_CLOCKSOURCENAMES_SIZE / 4];
        Tcat::buildLabels( labels, quads, TCAT_CLOCKSOURCENAMES_SIZE / 4 );
        m_t.setBlock( globalAddr( TCAT_REGISTER_GLOBAL_CLOCKSOURCENAMES ),
                      quads, TCAT_CLOCKSOURCENAMES_SIZE / 4 );
    }

    void setEapSections()
    {
        const fb_quadlet_t quads[] = {
            IMG_EAP_CAP_OFF / 4, IMG_EAP_CAP_SIZE / 4,
            IMG_EAP_CMD_OFF / 4, IMG_EAP_CMD_SIZE / 4,
            IMG_EAP_MIXER_OFF / 4, IMG_EAP_MIXER_SIZE / 4,
            IMG_EAP_PEAK_OFF / 4, IMG_EAP_PEAK_SIZE / 4,
            IMG_EAP_ROUTER_OFF / 4, IMG_EAP_ROUTER_SIZE / 4,
            IMG_EAP_STREAM_OFF / 4, IMG_EAP_STREAM_SIZE / 4,
            IMG_EAP_CURR_OFF / 4, IMG_EAP_CURR_SIZE / 4,
            IMG_EAP_STANDALONE_OFF / 4, IMG_EAP_STANDALONE_SIZE / 4,
            IMG_EAP_APP_OFF / 4, IMG_EAP_APP_SIZE / 4,
        };
        m_t.setBlock( eapAddr( 0, 0 ), quads, sizeof( quads ) / 4 );
    }

    void setRouterCaps( unsigned int max_entries, bool readonly )
    {
        fb_quadlet_t caps = 1 << TCAT_EAP_CAP_ROUTER_EXPOSED;
        caps |= 1 << TCAT_EAP_CAP_ROUTER_FLASHSTORED;
        if ( readonly ) {
            caps |= 1 << TCAT_EAP_CAP_ROUTER_READONLY;
        }
        caps |= max_entries << TCAT_EAP_CAP_ROUTER_MAXROUTES;
        m_t.setQuadlet( eapAddr( IMG_EAP_CAP_OFF, TCAT_EAP_CAPABILITY_ROUTER ), caps );
    }

    void setMixerCaps( unsigned int outputs, unsigned int inputs )
    {
        fb_quadlet_t caps = 0;
        if ( outputs > 0 ) {
            caps |= 1 << TCAT_EAP_CAP_MIXER_EXPOSED;
            caps |= 1 << TCAT_EAP_CAP_MIXER_FLASHSTORED;
        }
        caps |= inputs << TCAT_EAP_CAP_MIXER_INPUTS;
        caps |= outputs << TCAT_EAP_CAP_MIXER_OUTPUTS;
        m_t.setQuadlet( eapAddr( IMG_EAP_CAP_OFF, TCAT_EAP_CAPABILITY_MIXER ), caps );
    }

    void setGeneralCaps( bool peak )
    {
        fb_quadlet_t caps = 1 << TCAT_EAP_CAP_GENERAL_STRM_CFG_EN;
        caps |= 1 << TCAT_EAP_CAP_GENERAL_FLASH_EN;
        if ( peak ) {
            caps |= 1 << TCAT_EAP_CAP_GENERAL_PEAK_EN;
        }
        caps |= 2 << TCAT_EAP_CAP_GENERAL_MAX_TX_STREAM;
        caps |= 2 << TCAT_EAP_CAP_GENERAL_MAX_RX_STREAM;
        caps |= TCAT_EAP_CAP_GENERAL_CHIP_TCD2220 << TCAT_EAP_CAP_GENERAL_CHIP;
        m_t.setQuadlet( eapAddr( IMG_EAP_CAP_OFF, TCAT_EAP_CAPABILITY_GENERAL ), caps );
    }

    /// one tx and one rx stream, a count of 0 drops the stream
    void setCurrentStreams( enum Tcat::eRateMode mode, unsigned int tx_pcm, unsigned int rx_pcm )
    {
        fb_nodeaddr_t base = IMG_EAP_CURR_OFF + currentStreamOffset( mode );
        unsigned int nb_tx = tx_pcm ? 1 : 0;
        unsigned int nb_rx = rx_pcm ? 1 : 0;
        m_t.setQuadlet( eapAddr( base, TCAT_EAP_STREAM_NB_TX ), nb_tx );
        m_t.setQuadlet( eapAddr( base, TCAT_EAP_STREAM_NB_RX ), nb_rx );

        fb_nodeaddr_t entry = base + TCAT_EAP_STREAM_ENTRIES;
        if ( nb_tx ) {
            m_t.setQuadlet( eapAddr( entry, TCAT_EAP_STREAM_ENTRY_PCM ), tx_pcm );
            entry += TCAT_EAP_STREAM_ENTRY_SIZE;
        }
        if ( nb_rx ) {
            m_t.setQuadlet( eapAddr( entry, TCAT_EAP_STREAM_ENTRY_PCM ), rx_pcm );
        }
    }

    void setCurrentRouter( enum Tcat::eRateMode mode, const Tcat::RouterEntryVector& entries )
    {
        fb_nodeaddr_t base = IMG_EAP_CURR_OFF + currentRouterOffset( mode );
        m_t.setQuadlet( eapAddr( base, TCAT_EAP_ROUTER_NB_ENTRIES ), entries.size() );
        for ( unsigned int i = 0; i < entries.size(); ++i ) {
            m_t.setQuadlet( eapAddr( base, TCAT_EAP_ROUTER_ENTRIES + 4 * i ),
                            entries[i].encode() );
        }
    }

    /// entries of the router section as last written
    Tcat::RouterEntryVector getWrittenRouter() const
    {
        Tcat::RouterEntryVector entries;
        fb_quadlet_t count = m_t.getQuadlet( eapAddr( IMG_EAP_ROUTER_OFF, TCAT_EAP_ROUTER_NB_ENTRIES ) );
        for ( unsigned int i = 0; i < count; ++i ) {
            entries.push_back( Tcat::RouterEntry::decode(
                m_t.getQuadlet( eapAddr( IMG_EAP_ROUTER_OFF, TCAT_EAP_ROUTER_ENTRIES + 4 * i ) ) ) );
        }
        return entries;
    }

    void setPeak( unsigned int idx, const Tcat::RouterEntry& entry )
    {
        m_t.setQuadlet( eapAddr( IMG_EAP_PEAK_OFF, 4 * idx ), entry.encode() );
    }

    static fb_nodeaddr_t mixerCoefAddr( unsigned int dst, unsigned int src )
    {
        return eapAddr( IMG_EAP_MIXER_OFF,
                        TCAT_EAP_MIXER_COEFFICIENTS + ( dst * TCAT_EAP_MIXER_MAX_INPUTS + src ) * 4 );
    }
    void setMixerCoefficient( unsigned int dst, unsigned int src, int16_t coef )
        { m_t.setQuadlet( mixerCoefAddr( dst, src ), (uint16_t)coef ); }

    static fb_nodeaddr_t commandAddr()
        { return eapAddr( IMG_EAP_CMD_OFF, TCAT_EAP_COMMAND_OPCODE ); }
    static fb_nodeaddr_t standaloneAddr( fb_nodeaddr_t offset )
        { return eapAddr( IMG_EAP_STANDALONE_OFF, offset ); }
    static fb_nodeaddr_t appAddr( fb_nodeaddr_t offset )
        { return eapAddr( IMG_EAP_APP_OFF, offset ); }

    /// opcodes written to the command register, in order
    std::vector<fb_quadlet_t> getCommands() const
    {
        std::vector<fb_quadlet_t> cmds;
        const SpyTransport::WriteRecordVector& writes = m_t.getWrites();
        for ( SpyTransport::WriteRecordVector::const_iterator it = writes.begin();
              it != writes.end(); ++it ) {
            if ( it->addr == commandAddr() ) {
                cmds.push_back( it->values.at( 0 ) );
            }
        }
        return cmds;
    }

private:
    SpyTransport& m_t;
};

#endif // TESTS_TCATTESTIMAGE_H
